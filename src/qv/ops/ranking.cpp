#include "qv/ops/ranking.hpp"
#include "qv/core/traits.hpp"
#include "../instantiate.hpp"

#include <algorithm>
#include <cmath>

namespace qv {
namespace {

template <class T>
bool is_nan(T x) {
  if constexpr (is_floating_v<T>) return std::isnan(x);
  else return false;
}

} // namespace

template <class T>
std::vector<ScoredIndex<T>> top_indices(const Vector<T>& scores, std::size_t k) {
  std::vector<ScoredIndex<T>> ranked;
  ranked.reserve(scores.size());
  for (std::size_t i = 0; i < scores.size(); ++i) ranked.push_back({i, scores[i]});

  // NaN scores rank last; index breaks ties, so partial and full sorts
  // agree with a stable sort
  auto before = [](const ScoredIndex<T>& a, const ScoredIndex<T>& b) {
    const bool an = is_nan(a.score), bn = is_nan(b.score);
    if (an != bn) return bn;
    if (!an && a.score != b.score) return a.score > b.score;
    return a.index < b.index;
  };
  if (k < ranked.size()) {
    std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(k), ranked.end(), before);
    ranked.resize(k);
  } else {
    std::sort(ranked.begin(), ranked.end(), before);
  }
  return ranked;
}

#define QV_INSTANTIATE_RANKING(T) \
  template std::vector<ScoredIndex<T>> top_indices<T>(const Vector<T>&, std::size_t);

QV_FOR_NUMERIC_TYPES(QV_INSTANTIATE_RANKING)

} // namespace qv
