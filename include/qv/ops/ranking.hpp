#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "qv/core/checks.hpp"
#include "qv/core/vector.hpp"

namespace qv {

template <class T>
struct ScoredIndex {
  std::size_t index;
  T score;

  friend bool operator==(const ScoredIndex& a, const ScoredIndex& b) {
    return a.index == b.index && a.score == b.score;
  }
};

// Up to k entries of `scores`, highest first; equal scores keep ascending
// index order; NaN scores rank after every number. k > size() returns
// every entry. O(n log k) partial sort.
template <class T>
std::vector<ScoredIndex<T>> top_indices(const Vector<T>& scores, std::size_t k);

// Same ranking, reported against a parallel label sequence.
template <class T, class Label>
std::vector<std::pair<Label, T>> top_indices(const Vector<T>& scores, std::size_t k,
                                             const std::vector<Label>& labels) {
  detail::require_length("top_indices", "label count", scores.size(), labels.size());
  std::vector<std::pair<Label, T>> out;
  for (const auto& hit : top_indices(scores, k)) out.emplace_back(labels[hit.index], hit.score);
  return out;
}

} // namespace qv
