#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "shape.hpp"

namespace tweetprep {

/**
 * Produces consecutive tokens of some input, one at a time.
 */
class TokenStream {
  public:
    TokenStream();
    TokenStream(TokenStream const&);
    TokenStream(TokenStream&&);
    TokenStream& operator=(TokenStream const&);
    TokenStream& operator=(TokenStream&&);
    virtual ~TokenStream();

    /**
     * Returns the next token or `std::nullopt` if no more tokens are available.
     */
    virtual auto next() -> std::optional<std::string> = 0;

    /** Collects all remaining tokens. */
    [[nodiscard]] auto collect() -> Tokens;

    /** Appends all remaining tokens to `tokens`. */
    void collect_into(Tokens& tokens);
};

/**
 * Splits the input on any number of consecutive whitespace code points.
 *
 * The input is UTF-8; see `whitespace_prefix` for what counts as whitespace.
 */
class WhitespaceTokenStream: public TokenStream {
    std::string m_input;
    std::string_view m_view;

  public:
    explicit WhitespaceTokenStream(std::string input);
    WhitespaceTokenStream(WhitespaceTokenStream const&) = delete;
    WhitespaceTokenStream(WhitespaceTokenStream&&) = delete;
    WhitespaceTokenStream& operator=(WhitespaceTokenStream const&) = delete;
    WhitespaceTokenStream& operator=(WhitespaceTokenStream&&) = delete;
    ~WhitespaceTokenStream() override;

    auto next() -> std::optional<std::string> override;
};

}  // namespace tweetprep
