#pragma once

#include <string>
#include <vector>

namespace tweetprep {

/// Whole-text shape: a single string representing the entire item.
using Text = std::string;

/// Word-sequence shape: an ordered sequence of tokens.
using Tokens = std::vector<std::string>;

}  // namespace tweetprep
