#pragma once
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace qv {

// Dense 1-D numeric sequence with value semantics. Every kernel op takes
// Vectors by const& and returns a fresh Vector; nothing mutates an operand.
template <class T>
class Vector {
public:
  using value_type      = T;
  using size_type       = std::size_t;
  using storage_type    = std::vector<T>;
  using iterator        = typename storage_type::iterator;
  using const_iterator  = typename storage_type::const_iterator;
  using reference       = typename storage_type::reference;
  using const_reference = typename storage_type::const_reference;

  Vector() = default;
  explicit Vector(size_type n, const T& fill = T{}) : data_(n, fill) {}
  Vector(std::initializer_list<T> values) : data_(values) {}
  explicit Vector(storage_type values) : data_(std::move(values)) {}
  template <class It, class = typename std::iterator_traits<It>::iterator_category>
  Vector(It first, It last) : data_(first, last) {}

  size_type size() const noexcept { return data_.size(); }
  bool empty() const noexcept { return data_.empty(); }

  reference operator[](size_type i) { return data_[i]; }
  const_reference operator[](size_type i) const { return data_[i]; }
  reference at(size_type i) { return data_.at(i); }
  const_reference at(size_type i) const { return data_.at(i); }

  iterator begin() noexcept { return data_.begin(); }
  iterator end() noexcept { return data_.end(); }
  const_iterator begin() const noexcept { return data_.begin(); }
  const_iterator end() const noexcept { return data_.end(); }

  T* data() noexcept { return data_.data(); }
  const T* data() const noexcept { return data_.data(); }

  // underlying storage (for bindings / interop)
  const storage_type& values() const& noexcept { return data_; }
  storage_type values() && noexcept { return std::move(data_); }

  void reserve(size_type n) { data_.reserve(n); }
  void push_back(const T& v) { data_.push_back(v); }

  friend bool operator==(const Vector& a, const Vector& b) { return a.data_ == b.data_; }
  friend bool operator!=(const Vector& a, const Vector& b) { return a.data_ != b.data_; }

private:
  storage_type data_;
};

// Boolean selector produced by comparisons; always as long as its source.
using Mask = std::vector<bool>;

} // namespace qv
