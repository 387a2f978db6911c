#include "tweetprep/preprocess.hpp"

#include "tweetprep/string.hpp"

namespace tweetprep {

auto run_on_strings(std::vector<std::string> const& batch, Pipeline<Text, Text> const& pipeline)
    -> std::vector<std::string> {
    std::vector<std::string> output;
    for (auto const& input: batch) {
        auto result = pipeline.apply(input);
        auto text = std::string(trim(result));
        if (!text.empty()) {
            output.push_back(std::move(text));
        }
    }
    spdlog::debug("Kept {} of {} strings", output.size(), batch.size());
    return output;
}

auto clone_batch(std::vector<TextRecord> const& batch) -> std::vector<TextRecord> {
    return std::vector<TextRecord>(batch.begin(), batch.end());
}

}  // namespace tweetprep
