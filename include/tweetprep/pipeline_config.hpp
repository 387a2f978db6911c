#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "lemmatizer.hpp"
#include "pipeline.hpp"
#include "transform.hpp"

namespace tweetprep {

/**
 * Parameters of the token transforms that take any.
 */
struct TransformOptions {
    std::ptrdiff_t min_word_length = 3;
    bool remove_all_punctuation = false;
    std::string username_token = "<USERNAME>";
    std::string url_token = "<URL>";
    /// Each term gets its own `RemoveTerm` transform.
    std::vector<std::string> removed_terms{};
    std::vector<std::string> exact_terms{};
    bool ignore_case = true;
    /// Required by `lemmatize`.
    std::shared_ptr<Lemmatizer> lemmatizer = nullptr;
};

/** Names accepted by `token_transforms_from_name`. */
extern const std::set<std::string> VALID_TOKEN_TRANSFORMS;

/**
 * Constructs the token transforms registered under the given name.
 *
 * Most names produce exactly one transform; `term` produces one per removed term, possibly none.
 * Throws `std::domain_error` for unknown names.
 */
[[nodiscard]] auto token_transforms_from_name(std::string_view name, TransformOptions const& options)
    -> std::vector<std::shared_ptr<TokenTransform const>>;

/**
 * Builds `WhitespaceSplit`, the named token transforms in the given order, and `ConcatWords`.
 */
[[nodiscard]] auto make_text_pipeline(
    std::vector<std::string> const& names, TransformOptions const& options
) -> Pipeline<Text, Text>;

/**
 * Names of the transforms of the default tweet normalization: masks mentions and URLs,
 * drops retweet markers, strips punctuation, lowercases, collapses letter repetitions,
 * and removes empty tokens.
 *
 * With the default options, punctuation stripping keeps the `<` and `>` of the masks.
 */
[[nodiscard]] auto tweet_transform_names() -> std::vector<std::string>;

/** The default tweet normalization; see `tweet_transform_names`. */
[[nodiscard]] auto tweet_pipeline(TransformOptions const& options = {}) -> Pipeline<Text, Text>;

}  // namespace tweetprep
