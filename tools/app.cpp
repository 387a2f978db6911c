#include "app.hpp"

#include <algorithm>

#include "tweetprep/io.hpp"
#include "tweetprep/lemmatizer.hpp"

namespace tweetprep::arg {

Batch::Batch(CLI::App* app) {
    app->add_option("-i,--input", m_input_file, "Input file; standard input if missing");
    app->add_option("-o,--output", m_output_file, "Output file; standard output if missing");
    app->add_flag(
        "--records",
        m_records,
        "Input lines are tab-separated records: id, text, and optional label"
    );
}

auto Batch::input_file() const -> std::optional<std::string> const& {
    return m_input_file;
}

auto Batch::output_file() const -> std::optional<std::string> const& {
    return m_output_file;
}

auto Batch::records() const -> bool {
    return m_records;
}

Transforms::Transforms(CLI::App* app) {
    app->add_option("-T,--transforms", m_transforms, "Token transforms, in order of application")
        ->check(CLI::IsMember(VALID_TOKEN_TRANSFORMS));
    app->add_option("--min-word-length", m_min_word_length, "Minimum word length for `length`")
        ->capture_default_str();
    app->add_flag(
        "--remove-all-punctuation",
        m_remove_all_punctuation,
        "Strip also # @ < > in `punctuation`"
    );
    app->add_option("--username-token", m_username_token, "Mask for `mention`")
        ->capture_default_str();
    app->add_option("--url-token", m_url_token, "Mask for `url`")->capture_default_str();
    app->add_option("--remove-term", m_removed_terms, "Term for `term`; can be repeated");
    app->add_option("--exact-terms", m_exact_terms_file, "File with terms for `exact-terms`");
    app->add_flag("--case-sensitive", m_case_sensitive, "Match terms case-sensitively");
    app->add_option("--lemmatizer", m_lemmatizer, "Lemmatizer for `lemmatize`")
        ->capture_default_str()
        ->check(CLI::IsMember(VALID_LEMMATIZERS));
    app->add_option(
        "--lemma-dictionary", m_lemma_dictionary, "Lemma dictionary for `dictionary` lemmatizer"
    );
}

auto Transforms::transform_names() const -> std::vector<std::string> {
    if (m_transforms.empty()) {
        return tweet_transform_names();
    }
    return m_transforms;
}

auto Transforms::transform_options() const -> TransformOptions {
    TransformOptions options;
    options.min_word_length = m_min_word_length;
    options.remove_all_punctuation = m_remove_all_punctuation;
    options.username_token = m_username_token;
    options.url_token = m_url_token;
    options.removed_terms = m_removed_terms;
    if (m_exact_terms_file) {
        options.exact_terms = io::read_string_vector(*m_exact_terms_file);
    }
    options.ignore_case = !m_case_sensitive;
    auto names = transform_names();
    if (std::find(names.begin(), names.end(), "lemmatize") != names.end()) {
        options.lemmatizer = lemmatizer_from_name(m_lemmatizer, m_lemma_dictionary);
    }
    return options;
}

auto Transforms::pipeline() const -> Pipeline<Text, Text> {
    return make_text_pipeline(transform_names(), transform_options());
}

const std::set<std::string> Transforms::VALID_LEMMATIZERS = {"krovetz", "dictionary"};

LogLevel::LogLevel(CLI::App* app) {
    app->add_option("-L,--log-level", m_level, "Log level")
        ->capture_default_str()
        ->check(CLI::IsMember(VALID_LEVELS));
}

auto LogLevel::log_level() const -> spdlog::level::level_enum {
    return ENUM_MAP.at(m_level);
}

const std::set<std::string> LogLevel::VALID_LEVELS = {
    "trace", "debug", "info", "warn", "err", "critical", "off"
};
const std::map<std::string, spdlog::level::level_enum> LogLevel::ENUM_MAP = {
    {"trace", spdlog::level::level_enum::trace},
    {"debug", spdlog::level::level_enum::debug},
    {"info", spdlog::level::level_enum::info},
    {"warn", spdlog::level::level_enum::warn},
    {"err", spdlog::level::level_enum::err},
    {"critical", spdlog::level::level_enum::critical},
    {"off", spdlog::level::level_enum::off}
};

}  // namespace tweetprep::arg
