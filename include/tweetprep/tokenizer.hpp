#pragma once

#include <string_view>

#include "transform.hpp"

namespace tweetprep {

/**
 * Splits words on any number of consecutive whitespaces.
 *
 * Leading and trailing whitespace never produces empty tokens.
 */
class WhitespaceSplit final: public TextSplitter {
  public:
    [[nodiscard]] auto apply(Text input) const -> Tokens override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

/**
 * Joins tokens with a single space.
 */
class ConcatWords final: public TokenJoiner {
  public:
    [[nodiscard]] auto apply(Tokens input) const -> Text override;
    [[nodiscard]] auto name() const -> std::string_view override;
};

}  // namespace tweetprep
