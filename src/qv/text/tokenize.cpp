#include "qv/text/tokenize.hpp"

#include <cctype>

namespace qv::text {

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) {
      if (!current.empty()) tokens.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(static_cast<char>(std::tolower(c)));
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

} // namespace qv::text
