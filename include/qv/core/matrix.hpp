#pragma once
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

#include "qv/core/vector.hpp"

namespace qv {

// Row-major sequence of Vector rows. Construction accepts ragged input so it
// can be inspected; ops that need uniform rows reject it (see checks.hpp).
template <class T>
class Matrix {
public:
  using value_type     = T;
  using row_type       = Vector<T>;
  using size_type      = std::size_t;
  using iterator       = typename std::vector<row_type>::iterator;
  using const_iterator = typename std::vector<row_type>::const_iterator;

  Matrix() = default;
  Matrix(size_type rows, size_type cols, const T& fill = T{})
    : rows_(rows, row_type(cols, fill)) {}
  Matrix(std::initializer_list<std::initializer_list<T>> rows) {
    rows_.reserve(rows.size());
    for (const auto& r : rows) rows_.emplace_back(r);
  }
  explicit Matrix(std::vector<row_type> rows) : rows_(std::move(rows)) {}
  explicit Matrix(const std::vector<std::vector<T>>& rows) {
    rows_.reserve(rows.size());
    for (const auto& r : rows) rows_.emplace_back(r);
  }

  size_type row_count() const noexcept { return rows_.size(); }
  // Column count of the first row; 0 for an empty matrix.
  size_type column_count() const noexcept { return rows_.empty() ? 0 : rows_.front().size(); }
  bool empty() const noexcept { return rows_.empty(); }

  bool is_ragged() const noexcept {
    for (const auto& r : rows_)
      if (r.size() != rows_.front().size()) return true;
    return false;
  }

  row_type& operator[](size_type i) { return rows_[i]; }
  const row_type& operator[](size_type i) const { return rows_[i]; }
  row_type& at(size_type i) { return rows_.at(i); }
  const row_type& at(size_type i) const { return rows_.at(i); }

  iterator begin() noexcept { return rows_.begin(); }
  iterator end() noexcept { return rows_.end(); }
  const_iterator begin() const noexcept { return rows_.begin(); }
  const_iterator end() const noexcept { return rows_.end(); }

  const std::vector<row_type>& rows() const noexcept { return rows_; }

  std::vector<std::vector<T>> to_nested() const {
    std::vector<std::vector<T>> out;
    out.reserve(rows_.size());
    for (const auto& r : rows_) out.push_back(r.values());
    return out;
  }

  void reserve(size_type n) { rows_.reserve(n); }
  void push_back(row_type r) { rows_.push_back(std::move(r)); }

  friend bool operator==(const Matrix& a, const Matrix& b) { return a.rows_ == b.rows_; }
  friend bool operator!=(const Matrix& a, const Matrix& b) { return !(a == b); }

private:
  std::vector<row_type> rows_;
};

} // namespace qv
