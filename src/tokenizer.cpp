#include "tweetprep/tokenizer.hpp"

#include <boost/algorithm/string/join.hpp>

#include "tweetprep/token_stream.hpp"

namespace tweetprep {

auto WhitespaceSplit::apply(Text input) const -> Tokens {
    return WhitespaceTokenStream(std::move(input)).collect();
}

auto WhitespaceSplit::name() const -> std::string_view {
    return "whitespace-split";
}

auto ConcatWords::apply(Tokens input) const -> Text {
    return boost::algorithm::join(input, " ");
}

auto ConcatWords::name() const -> std::string_view {
    return "concat";
}

}  // namespace tweetprep
