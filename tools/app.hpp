#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "tweetprep/pipeline.hpp"
#include "tweetprep/pipeline_config.hpp"

namespace tweetprep {

namespace arg {

    /**
     * Input and output of a batch tool.
     *
     * Standard input and output are used when no files are given.
     */
    struct Batch {
        explicit Batch(CLI::App* app);
        [[nodiscard]] auto input_file() const -> std::optional<std::string> const&;
        [[nodiscard]] auto output_file() const -> std::optional<std::string> const&;
        [[nodiscard]] auto records() const -> bool;

      private:
        std::optional<std::string> m_input_file{};
        std::optional<std::string> m_output_file{};
        bool m_records = false;
    };

    /**
     * Token transforms of the pipeline and their parameters.
     *
     * The pipeline always starts with whitespace splitting and ends with joining words.
     * When no transforms are named, the tweet preset is used.
     */
    struct Transforms {
        static const std::set<std::string> VALID_LEMMATIZERS;

        explicit Transforms(CLI::App* app);
        [[nodiscard]] auto transform_names() const -> std::vector<std::string>;
        [[nodiscard]] auto transform_options() const -> TransformOptions;
        [[nodiscard]] auto pipeline() const -> Pipeline<Text, Text>;

      private:
        std::vector<std::string> m_transforms{};
        std::ptrdiff_t m_min_word_length = 3;
        bool m_remove_all_punctuation = false;
        std::string m_username_token = "<USERNAME>";
        std::string m_url_token = "<URL>";
        std::vector<std::string> m_removed_terms{};
        std::optional<std::string> m_exact_terms_file{};
        bool m_case_sensitive = false;
        std::string m_lemmatizer = "dictionary";
        std::optional<std::string> m_lemma_dictionary{};
    };

    /**
     * Log level configuration.
     *
     * This option takes one of the valid string values and translates it into spdlog log level
     * values.
     */
    struct LogLevel {
        static const std::set<std::string> VALID_LEVELS;
        static const std::map<std::string, spdlog::level::level_enum> ENUM_MAP;

        explicit LogLevel(CLI::App* app);
        [[nodiscard]] auto log_level() const -> spdlog::level::level_enum;

      private:
        std::string m_level = "info";
    };

}  // namespace arg

/**
 * A declarative way to define CLI interface. This class inherits from `CLI::App` and therefore it
 * can be used like a regular `CLI::App` object once it is defined.
 */
template <typename... Args>
struct App: public CLI::App, public Args... {
    explicit App(std::string const& description) : CLI::App(description), Args(this)... {
        this->set_config("--config", "", "Configuration .ini file", false);
    }
};

using PreprocessApp = App<arg::Batch, arg::Transforms, arg::LogLevel>;

}  // namespace tweetprep
