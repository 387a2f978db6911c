#include "tweetprep/pipeline_config.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "tweetprep/token_filter.hpp"
#include "tweetprep/tokenizer.hpp"

namespace tweetprep {

const std::set<std::string> VALID_TOKEN_TRANSFORMS = {
    "lowercase",
    "length",
    "punctuation",
    "mention",
    "url",
    "rt",
    "repetitions",
    "term",
    "exact-terms",
    "empty",
    "digits",
    "lemmatize",
    "non-alphabet",
};

auto token_transforms_from_name(std::string_view name, TransformOptions const& options)
    -> std::vector<std::shared_ptr<TokenTransform const>> {
    std::vector<std::shared_ptr<TokenTransform const>> transforms;
    if (name == "lowercase") {
        transforms.push_back(std::make_shared<Lowercase const>());
    } else if (name == "length") {
        transforms.push_back(std::make_shared<WordLengthFilter const>(options.min_word_length));
    } else if (name == "punctuation") {
        transforms.push_back(std::make_shared<PunctuationStrip const>(options.remove_all_punctuation));
    } else if (name == "mention") {
        transforms.push_back(std::make_shared<MentionMask const>(options.username_token));
    } else if (name == "url") {
        transforms.push_back(std::make_shared<UrlMask const>(options.url_token));
    } else if (name == "rt") {
        transforms.push_back(std::make_shared<RemoveRT const>());
    } else if (name == "repetitions") {
        transforms.push_back(std::make_shared<RemoveLetterRepetitions const>());
    } else if (name == "term") {
        for (auto const& term: options.removed_terms) {
            transforms.push_back(std::make_shared<RemoveTerm const>(term, options.ignore_case));
        }
    } else if (name == "exact-terms") {
        transforms.push_back(
            std::make_shared<RemoveExactTerms const>(options.exact_terms, options.ignore_case)
        );
    } else if (name == "empty") {
        transforms.push_back(std::make_shared<RemoveEmptyStrings const>());
    } else if (name == "digits") {
        transforms.push_back(std::make_shared<RemoveDigits const>());
    } else if (name == "lemmatize") {
        transforms.push_back(std::make_shared<Lemmatize const>(options.lemmatizer));
    } else if (name == "non-alphabet") {
        transforms.push_back(std::make_shared<RemoveNonAlphabet const>());
    } else {
        throw std::domain_error(fmt::format("invalid token transform name: {}", name));
    }
    return transforms;
}

auto make_text_pipeline(std::vector<std::string> const& names, TransformOptions const& options)
    -> Pipeline<Text, Text> {
    auto tokens = make_pipeline<WhitespaceSplit>();
    for (auto const& name: names) {
        for (auto& transform: token_transforms_from_name(name, options)) {
            tokens = tokens.then(std::move(transform));
        }
    }
    auto pipeline = tokens.emplace<ConcatWords>();
    spdlog::debug("Assembled a pipeline of {} transforms", pipeline.size());
    return pipeline;
}

auto tweet_transform_names() -> std::vector<std::string> {
    return {"mention", "url", "rt", "punctuation", "lowercase", "repetitions", "empty"};
}

auto tweet_pipeline(TransformOptions const& options) -> Pipeline<Text, Text> {
    return make_text_pipeline(tweet_transform_names(), options);
}

}  // namespace tweetprep
