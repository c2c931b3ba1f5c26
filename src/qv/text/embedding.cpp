#include "qv/text/embedding.hpp"
#include "qv/core/log.hpp"
#include "qv/ops/similarity.hpp"
#include "qv/text/tokenize.hpp"

namespace qv::text {

Matrix<double> embed(const std::vector<std::string>& tokens, const Embeddings& embeddings) {
  Matrix<double> rows;
  rows.reserve(tokens.size());
  for (const auto& tok : tokens) {
    auto it = embeddings.find(tok);
    if (it == embeddings.end()) {
      QV_LOG_TRACE("embed: no vector for token '{}'", tok);
      continue;
    }
    rows.push_back(it->second);
  }
  return rows;
}

std::optional<Vector<double>> text_vector(std::string_view text, const Embeddings& embeddings) {
  return averaged(embed(tokenize(text), embeddings));
}

} // namespace qv::text
