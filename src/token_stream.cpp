#include "tweetprep/token_stream.hpp"

#include <utility>

#include "tweetprep/string.hpp"

namespace tweetprep {

TokenStream::TokenStream() = default;
TokenStream::TokenStream(TokenStream const&) = default;
TokenStream::TokenStream(TokenStream&&) = default;
TokenStream& TokenStream::operator=(TokenStream const&) = default;
TokenStream& TokenStream::operator=(TokenStream&&) = default;
TokenStream::~TokenStream() = default;

auto TokenStream::collect() -> Tokens {
    Tokens tokens;
    collect_into(tokens);
    return tokens;
}

void TokenStream::collect_into(Tokens& tokens) {
    while (auto token = next()) {
        tokens.push_back(std::move(*token));
    }
}

WhitespaceTokenStream::WhitespaceTokenStream(std::string input)
    : m_input(std::move(input)), m_view(m_input) {}

WhitespaceTokenStream::~WhitespaceTokenStream() = default;

auto WhitespaceTokenStream::next() -> std::optional<std::string> {
    m_view.remove_prefix(whitespace_prefix(m_view));
    if (m_view.empty()) {
        return std::nullopt;
    }
    auto length = find_whitespace(m_view);
    auto token = std::string(m_view.substr(0, length));
    m_view.remove_prefix(length);
    return token;
}

}  // namespace tweetprep
