#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "tweetprep/io.hpp"
#include "tweetprep/preprocess.hpp"
#include "tweetprep/text_record.hpp"

using namespace tweetprep;

namespace {

void preprocess_strings(std::istream& is, std::ostream& os, Pipeline<Text, Text> const& pipeline) {
    std::vector<std::string> batch;
    io::for_each_line(is, [&](std::string const& line) { batch.push_back(line); });
    for (auto const& text: run_on_strings(batch, pipeline)) {
        os << text << '\n';
    }
}

void preprocess_records(std::istream& is, std::ostream& os, Pipeline<Text, Text> const& pipeline) {
    std::vector<TextRecord> batch;
    while (auto record = read_record(is)) {
        batch.push_back(std::move(*record));
    }
    for (auto const& record: run_on_records(batch, pipeline)) {
        os << record << '\n';
    }
}

}  // namespace

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt(""));

    PreprocessApp app{"preprocess_tweets - normalize tweets for text analysis."};
    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(app.log_level());

    try {
        auto pipeline = app.pipeline();
        spdlog::info("Pipeline: {}", fmt::join(pipeline.names(), " -> "));

        std::ifstream input_file;
        if (app.input_file()) {
            input_file = io::open_input(*app.input_file());
        }
        std::istream& is = app.input_file() ? input_file : std::cin;

        std::ofstream output_file;
        if (app.output_file()) {
            output_file.open(*app.output_file());
            if (!output_file) {
                throw std::runtime_error(
                    fmt::format("Cannot open output file: {}", *app.output_file())
                );
            }
        }
        std::ostream& os = app.output_file() ? output_file : std::cout;

        if (app.records()) {
            preprocess_records(is, os, pipeline);
        } else {
            preprocess_strings(is, os, pipeline);
        }
    } catch (std::exception const& err) {
        spdlog::error(err.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
