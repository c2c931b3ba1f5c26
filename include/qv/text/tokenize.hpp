#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace qv::text {

// Lowercase (ASCII) and split on whitespace; empty tokens are dropped.
std::vector<std::string> tokenize(std::string_view text);

} // namespace qv::text
