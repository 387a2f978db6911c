#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

#include "lemmatizer.hpp"
#include "transform.hpp"

namespace tweetprep {

/**
 * Token filters transform a sequence of tokens into another sequence of tokens.
 *
 * Depending on the filter, tokens are:
 *  - rewritten one by one (lowercasing, masking, stripping characters),
 *  - dropped (stop terms, retweet markers, short or empty tokens),
 *  - expanded into several tokens (punctuation stripping re-splits on whitespace).
 *
 * None of them removes tokens that became empty as a side effect of rewriting; `RemoveEmptyStrings`
 * does that.
 */
class Lowercase final: public TokenTransform {
  public:
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Drops tokens shorter than the minimum length (in code points) after trimming, and trims
 * the remaining tokens. A non-positive minimum never filters.
 */
class WordLengthFilter final: public TokenTransform {
    std::ptrdiff_t m_min_length;

  public:
    explicit WordLengthFilter(std::ptrdiff_t min_length);
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Replaces ASCII punctuation with spaces and splits the results on whitespace.
 *
 * Unless `remove_all` is set, `#`, `@`, `<`, and `>` are kept so that hashtags, mentions,
 * and masks such as `<URL>` survive.
 */
class PunctuationStrip final: public TokenTransform {
    std::array<bool, 256> m_strip{};

  public:
    explicit PunctuationStrip(bool remove_all = false);
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Replaces each regex match within each token.
 *
 * The replacement is a Perl format string, e.g., `$1`, unless `format_literal` is passed.
 */
class RegexReplace: public TokenTransform {
    boost::regex m_pattern;
    std::string m_replacement;
    boost::regex_constants::match_flag_type m_flags;

  public:
    RegexReplace(
        boost::regex pattern,
        std::string replacement,
        boost::regex_constants::match_flag_type flags = boost::regex_constants::format_default
    );
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
};

/** Replaces `@name` with a mask token, `<USERNAME>` by default. */
class MentionMask final: public RegexReplace {
  public:
    explicit MentionMask(std::string token = "<USERNAME>");
    [[nodiscard]] auto name() const -> std::string_view override;
};

/** Replaces `http://...` and `https://...` with a mask token, `<URL>` by default. */
class UrlMask final: public RegexReplace {
  public:
    explicit UrlMask(std::string token = "<URL>");
    [[nodiscard]] auto name() const -> std::string_view override;
};

/** Collapses three or more repeated lowercase letters into one, e.g., `soooo` becomes `so`. */
class RemoveLetterRepetitions final: public RegexReplace {
  public:
    RemoveLetterRepetitions();
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Drops retweet markers: tokens starting with a whole word `rt` or `RT`, e.g., `RT` or `rt:`.
 *
 * Word boundaries are Unicode-aware, so `rté` is kept. Tokens must be valid UTF-8,
 * otherwise `std::out_of_range` is thrown.
 */
class RemoveRT final: public TokenTransform {
    boost::u32regex m_pattern;

  public:
    RemoveRT();
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Drops tokens containing the term. Kept tokens are not modified.
 */
class RemoveTerm final: public TokenTransform {
    std::string m_term;
    bool m_ignore_case;

  public:
    explicit RemoveTerm(std::string term, bool ignore_case = true);
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Drops tokens equal to any of the terms.
 *
 * When ignoring case, both the terms and the tokens are lowercased, and the kept tokens are
 * returned lowercased. Otherwise, tokens are compared verbatim with the terms as given.
 */
class RemoveExactTerms final: public TokenTransform {
    std::unordered_set<std::string> m_terms;
    bool m_ignore_case;

  public:
    explicit RemoveExactTerms(std::vector<std::string> const& terms, bool ignore_case = true);
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/** Drops tokens consisting of whitespace only. */
class RemoveEmptyStrings final: public TokenTransform {
  public:
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/** Removes digits `0-9` from tokens. */
class RemoveDigits final: public TokenTransform {
  public:
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/** Removes all characters but `a-z` and `A-Z` from tokens. */
class RemoveNonAlphabet final: public TokenTransform {
  public:
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Replaces tokens with their base forms.
 *
 * The lemmatizer is shared and may be stateful; see `Lemmatizer`.
 */
class Lemmatize final: public TokenTransform {
    std::shared_ptr<Lemmatizer> m_lemmatizer;

  public:
    explicit Lemmatize(std::shared_ptr<Lemmatizer> lemmatizer);
    [[nodiscard]] auto apply(Tokens input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

}  // namespace tweetprep
