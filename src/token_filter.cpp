#include "tweetprep/token_filter.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "tweetprep/string.hpp"
#include "tweetprep/token_stream.hpp"

namespace tweetprep {

namespace {

    /// Applies `fn` to every token in place.
    template <typename Fn>
    auto map_tokens(Tokens tokens, Fn fn) -> Tokens {
        for (auto& token: tokens) {
            fn(token);
        }
        return tokens;
    }

    /// Keeps only tokens satisfying `keep`, preserving their order.
    template <typename Predicate>
    auto retain_tokens(Tokens tokens, Predicate keep) -> Tokens {
        tokens.erase(
            std::remove_if(tokens.begin(), tokens.end(), [&](auto const& token) { return !keep(token); }),
            tokens.end()
        );
        return tokens;
    }

    template <typename Predicate>
    void erase_chars_if(std::string& token, Predicate pred) {
        token.erase(std::remove_if(token.begin(), token.end(), pred), token.end());
    }

}  // namespace

auto Lowercase::apply(Tokens input) const -> Tokens {
    return map_tokens(std::move(input), [](std::string& token) { boost::algorithm::to_lower(token); });
}

auto Lowercase::name() const -> std::string_view {
    return "lowercase";
}

WordLengthFilter::WordLengthFilter(std::ptrdiff_t min_length) : m_min_length(min_length) {}

auto WordLengthFilter::apply(Tokens input) const -> Tokens {
    Tokens output;
    for (auto const& token: input) {
        auto trimmed = trim(token);
        if (static_cast<std::ptrdiff_t>(utf8_length(trimmed)) >= m_min_length) {
            output.emplace_back(trimmed);
        }
    }
    return output;
}

auto WordLengthFilter::name() const -> std::string_view {
    return "length";
}

PunctuationStrip::PunctuationStrip(bool remove_all) {
    for (std::size_t ch = 0; ch < m_strip.size(); ++ch) {
        m_strip[ch] = is_punctuation(static_cast<char>(ch));
    }
    if (!remove_all) {
        for (unsigned char special: {'#', '@', '<', '>'}) {
            m_strip[special] = false;
        }
    }
}

auto PunctuationStrip::apply(Tokens input) const -> Tokens {
    Tokens output;
    for (auto& token: input) {
        std::replace_if(
            token.begin(),
            token.end(),
            [this](char ch) { return m_strip[static_cast<unsigned char>(ch)]; },
            ' '
        );
        WhitespaceTokenStream(std::move(token)).collect_into(output);
    }
    return output;
}

auto PunctuationStrip::name() const -> std::string_view {
    return "punctuation";
}

RegexReplace::RegexReplace(
    boost::regex pattern, std::string replacement, boost::regex_constants::match_flag_type flags
)
    : m_pattern(std::move(pattern)), m_replacement(std::move(replacement)), m_flags(flags) {}

auto RegexReplace::apply(Tokens input) const -> Tokens {
    return map_tokens(std::move(input), [this](std::string& token) {
        token = boost::regex_replace(token, m_pattern, m_replacement, m_flags);
    });
}

MentionMask::MentionMask(std::string token)
    : RegexReplace(
        boost::regex(R"(@\S+)"), std::move(token), boost::regex_constants::format_literal
    ) {}

auto MentionMask::name() const -> std::string_view {
    return "mention";
}

UrlMask::UrlMask(std::string token)
    : RegexReplace(
        boost::regex(R"(https?://\S*)"), std::move(token), boost::regex_constants::format_literal
    ) {}

auto UrlMask::name() const -> std::string_view {
    return "url";
}

RemoveLetterRepetitions::RemoveLetterRepetitions()
    : RegexReplace(boost::regex(R"(([a-z])\1\1+)"), "$1") {}

auto RemoveLetterRepetitions::name() const -> std::string_view {
    return "repetitions";
}

RemoveRT::RemoveRT() : m_pattern(boost::make_u32regex(R"(\brt\b|\bRT\b)")) {}

auto RemoveRT::apply(Tokens input) const -> Tokens {
    return retain_tokens(std::move(input), [this](std::string const& token) {
        boost::smatch match;
        return !boost::u32regex_search(
            token, match, m_pattern, boost::regex_constants::match_continuous
        );
    });
}

auto RemoveRT::name() const -> std::string_view {
    return "rt";
}

RemoveTerm::RemoveTerm(std::string term, bool ignore_case)
    : m_term(std::move(term)), m_ignore_case(ignore_case) {
    if (m_ignore_case) {
        boost::algorithm::to_lower(m_term);
    }
}

auto RemoveTerm::apply(Tokens input) const -> Tokens {
    return retain_tokens(std::move(input), [this](std::string const& token) {
        if (m_ignore_case) {
            return boost::algorithm::to_lower_copy(token).find(m_term) == std::string::npos;
        }
        return token.find(m_term) == std::string::npos;
    });
}

auto RemoveTerm::name() const -> std::string_view {
    return "term";
}

RemoveExactTerms::RemoveExactTerms(std::vector<std::string> const& terms, bool ignore_case)
    : m_ignore_case(ignore_case) {
    for (auto const& term: terms) {
        m_terms.insert(m_ignore_case ? boost::algorithm::to_lower_copy(term) : term);
    }
}

auto RemoveExactTerms::apply(Tokens input) const -> Tokens {
    Tokens output;
    for (auto& token: input) {
        // Kept tokens are emitted in the form they were compared in.
        if (m_ignore_case) {
            boost::algorithm::to_lower(token);
        }
        if (m_terms.find(token) == m_terms.end()) {
            output.push_back(std::move(token));
        }
    }
    return output;
}

auto RemoveExactTerms::name() const -> std::string_view {
    return "exact-terms";
}

auto RemoveEmptyStrings::apply(Tokens input) const -> Tokens {
    return retain_tokens(std::move(input), [](std::string const& token) {
        return !is_blank(token);
    });
}

auto RemoveEmptyStrings::name() const -> std::string_view {
    return "empty";
}

auto RemoveDigits::apply(Tokens input) const -> Tokens {
    return map_tokens(std::move(input), [](std::string& token) { erase_chars_if(token, is_digit); });
}

auto RemoveDigits::name() const -> std::string_view {
    return "digits";
}

auto RemoveNonAlphabet::apply(Tokens input) const -> Tokens {
    return map_tokens(std::move(input), [](std::string& token) {
        erase_chars_if(token, [](char ch) { return !is_alpha(ch); });
    });
}

auto RemoveNonAlphabet::name() const -> std::string_view {
    return "non-alphabet";
}

Lemmatize::Lemmatize(std::shared_ptr<Lemmatizer> lemmatizer) : m_lemmatizer(std::move(lemmatizer)) {
    if (m_lemmatizer == nullptr) {
        throw std::invalid_argument("lemmatize transform requires a lemmatizer");
    }
}

auto Lemmatize::apply(Tokens input) const -> Tokens {
    return map_tokens(std::move(input), [this](std::string& token) {
        token = m_lemmatizer->lemmatize(token);
    });
}

auto Lemmatize::name() const -> std::string_view {
    return "lemmatize";
}

}  // namespace tweetprep
