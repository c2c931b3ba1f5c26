#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

namespace qv::text {

// Caller-owned word -> vector table. Keys are matched exactly, so they
// should be lowercase to line up with tokenize().
using Embeddings = std::unordered_map<std::string, Vector<double>>;

// One row per known token, in token order; unknown tokens are skipped.
Matrix<double> embed(const std::vector<std::string>& tokens, const Embeddings& embeddings);

// Mean embedding of the known tokens in `text`; nullopt when none are known
// or the known vectors differ in length.
std::optional<Vector<double>> text_vector(std::string_view text, const Embeddings& embeddings);

} // namespace qv::text
