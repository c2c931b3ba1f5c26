#include "qv/ops/series.hpp"
#include "qv/core/log.hpp"
#include "qv/ops/stats.hpp"
#include "qv/parallel/transform.hpp"
#include "../instantiate.hpp"

#include <algorithm>
#include <cmath>

namespace qv {
namespace {

template <class T>
T aggregate(const Vector<T>& chunk, AggregationMethod method) {
  switch (method) {
    case AggregationMethod::sum:   return sum(chunk);
    case AggregationMethod::mean:  return mean(chunk).value_or(T(0));
    case AggregationMethod::count: return static_cast<T>(chunk.size());
    case AggregationMethod::min:   return min(chunk).value_or(T(0));
    case AggregationMethod::max:   return max(chunk).value_or(T(0));
  }
  return T(0);
}

template <class T>
T pearson(const Vector<T>& x, const Vector<T>& y) {
  if (x.size() != y.size() || x.empty()) return T(0);
  const T mx = *mean(x);
  const T my = *mean(y);
  T num = T(0), dx2 = T(0), dy2 = T(0);
  for (std::size_t i = 0; i < x.size(); ++i) {
    const T dx = x[i] - mx;
    const T dy = y[i] - my;
    num += dx * dy;
    dx2 += dx * dx;
    dy2 += dy * dy;
  }
  if (!(dx2 > T(0) && dy2 > T(0))) return T(0);
  return num / std::sqrt(dx2 * dy2);
}

} // namespace

template <class T>
Vector<T> rolling_mean(const Vector<T>& v, std::size_t window) {
  if (window == 0 || v.empty()) return {};
  if (window > v.size()) return Vector<T>(v.size(), *mean(v));
  Vector<T> out;
  out.reserve(v.size());
  for (std::size_t i = 0; i < v.size(); ++i) {
    const std::size_t lo = i + 1 >= window ? i + 1 - window : 0;
    T acc = T(0);
    for (std::size_t k = lo; k <= i; ++k) acc += v[k];
    out.push_back(acc / static_cast<T>(i - lo + 1));
  }
  return out;
}

template <class T>
Vector<T> diff(const Vector<T>& v, std::size_t lag) {
  if (lag == 0 || lag >= v.size()) return {};
  Vector<T> out;
  out.reserve(v.size() - lag);
  for (std::size_t i = lag; i < v.size(); ++i) out.push_back(v[i] - v[i - lag]);
  return out;
}

template <class T>
Vector<T> percent_change(const Vector<T>& v, std::size_t lag) {
  if (lag == 0 || lag >= v.size()) return {};
  Vector<T> out;
  out.reserve(v.size() - lag);
  for (std::size_t i = lag; i < v.size(); ++i) {
    const T prev = v[i - lag];
    out.push_back(prev == T(0) ? T(0) : (v[i] - prev) / prev * T(100));
  }
  return out;
}

template <class T>
std::vector<HistogramBin<T>> histogram(const Vector<T>& v, std::size_t bins) {
  if (bins == 0 || v.empty()) return {};
  const T lo = *min(v);
  const T hi = *max(v);
  if (lo == hi) return {{lo, v.size()}};

  const T width = (hi - lo) / static_cast<T>(bins);
  std::vector<HistogramBin<T>> out;
  out.reserve(bins);
  for (std::size_t b = 0; b < bins; ++b) {
    const T lower = lo + static_cast<T>(b) * width;
    const T upper = lower + width;
    const bool last = b + 1 == bins;
    std::size_t count = 0;
    for (const T& x : v)
      if (x >= lower && (last ? x <= upper : x < upper)) ++count;
    out.push_back({(lower + upper) / T(2), count});
  }
  return out;
}

template <class T>
std::optional<T> percentile(const Vector<T>& v, double p) {
  if (v.empty() || !(p >= 0.0 && p <= 100.0)) return std::nullopt;
  std::vector<T> sorted = v.values();
  std::sort(sorted.begin(), sorted.end());
  const double pos = p / 100.0 * static_cast<double>(sorted.size() - 1);
  const std::size_t lower = static_cast<std::size_t>(pos);
  const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
  const T frac = static_cast<T>(pos - static_cast<double>(lower));
  return sorted[lower] + frac * (sorted[upper] - sorted[lower]);
}

template <class T>
std::optional<Quartiles<T>> quartiles(const Vector<T>& v) {
  if (v.empty()) return std::nullopt;
  Quartiles<T> q;
  q.min = *min(v);
  q.max = *max(v);
  q.q1 = *percentile(v, 25.0);
  q.median = *percentile(v, 50.0);
  q.q3 = *percentile(v, 75.0);
  q.iqr = q.q3 - q.q1;
  return q;
}

template <class T>
T percentile_rank(const Vector<T>& v, T value) {
  if (v.empty()) return T(0);
  std::size_t below = 0, equal = 0;
  for (const T& x : v) {
    if (x < value) ++below;
    else if (x == value) ++equal;
  }
  return (static_cast<T>(below) + static_cast<T>(equal) / T(2)) / static_cast<T>(v.size()) * T(100);
}

template <class T>
Vector<T> percentile_ranks(const Vector<T>& v) {
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back(percentile_rank(v, x));
  return out;
}

template <class T>
Vector<T> scaled(const Vector<T>& v, T lo, T hi) {
  if (v.empty()) return {};
  const T vmin = *min(v);
  const T range = *max(v) - vmin;
  if (range == T(0)) return Vector<T>(v.size(), lo);
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back((x - vmin) / range * (hi - lo) + lo);
  return out;
}

template <class T>
Vector<T> as_percentages(const Vector<T>& v) {
  const T total = sum(v);
  if (total == T(0)) return Vector<T>(v.size(), T(0));
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back(x / total * T(100));
  return out;
}

template <class T>
Vector<T> standardized(const Vector<T>& v) {
  if (v.empty()) return {};
  const T m = *mean(v);
  const T s = *stddev(v);
  if (s == T(0)) return Vector<T>(v.size(), T(0));
  Vector<T> out;
  out.reserve(v.size());
  for (const T& x : v) out.push_back((x - m) / s);
  return out;
}

template <class T>
std::map<std::string, T> group_by(const Vector<T>& values, const std::vector<std::string>& categories,
                                  AggregationMethod method) {
  if (values.size() != categories.size()) {
    QV_LOG_DEBUG("group_by: {} values vs {} categories, returning no groups", values.size(), categories.size());
    return {};
  }
  std::map<std::string, Vector<T>> groups;
  for (std::size_t i = 0; i < values.size(); ++i) groups[categories[i]].push_back(values[i]);
  std::map<std::string, T> out;
  for (const auto& [category, members] : groups) out.emplace(category, aggregate(members, method));
  return out;
}

template <class T>
std::vector<std::pair<std::string, T>> grouped_data(const Vector<T>& values,
                                                    const std::vector<std::string>& categories,
                                                    AggregationMethod method) {
  const auto groups = group_by(values, categories, method);
  return std::vector<std::pair<std::string, T>>(groups.begin(), groups.end());
}

template <class T>
Vector<T> downsample(const Vector<T>& v, std::size_t factor, AggregationMethod method) {
  if (factor == 0 || v.empty()) return {};
  if (factor >= v.size()) return Vector<T>{aggregate(v, method)};
  Vector<T> out;
  out.reserve((v.size() + factor - 1) / factor);
  for (std::size_t start = 0; start < v.size(); start += factor) {
    const std::size_t end = std::min(start + factor, v.size());
    out.push_back(aggregate(Vector<T>(v.begin() + static_cast<std::ptrdiff_t>(start),
                                      v.begin() + static_cast<std::ptrdiff_t>(end)),
                            method));
  }
  return out;
}

template <class T>
Matrix<T> stacked_cumulative(const Matrix<T>& series) {
  if (series.empty()) return {};
  const std::size_t len = series[0].size();
  Vector<T> running(len, T(0));
  Matrix<T> out;
  for (const auto& s : series) {
    if (s.size() != len) continue;
    for (std::size_t i = 0; i < len; ++i) running[i] += s[i];
    out.push_back(running);
  }
  return out;
}

template <class T>
Matrix<T> stacked_percentage(const Matrix<T>& series) {
  if (series.empty()) return {};
  const std::size_t len = series[0].size();
  Vector<T> totals(len, T(0));
  for (const auto& s : series) {
    if (s.size() != len) continue;
    for (std::size_t i = 0; i < len; ++i) totals[i] += s[i];
  }
  Matrix<T> out;
  out.reserve(series.row_count());
  for (const auto& s : series) {
    Vector<T> pct;
    pct.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
      const bool has_total = i < len && totals[i] != T(0);
      pct.push_back(has_total ? s[i] / totals[i] * T(100) : T(0));
    }
    out.push_back(std::move(pct));
  }
  return out;
}

template <class T>
Matrix<T> correlation_matrix(const Matrix<T>& series) {
  const std::size_t n = series.row_count();
  Matrix<T> out(n, n, T(0));
  parallel::for_rows(n, [&](std::size_t i) {
    for (std::size_t j = 0; j < n; ++j) out[i][j] = i == j ? T(1) : pearson(series[i], series[j]);
  });
  return out;
}

template <class T>
std::vector<HeatmapCell<T>> heatmap_data(const Matrix<T>& series, const std::vector<std::string>& labels) {
  if (labels.size() != series.row_count()) return {};
  const Matrix<T> corr = correlation_matrix(series);
  std::vector<HeatmapCell<T>> out;
  out.reserve(labels.size() * labels.size());
  for (std::size_t i = 0; i < corr.row_count(); ++i)
    for (std::size_t j = 0; j < corr[i].size(); ++j) out.push_back({labels[i], labels[j], corr[i][j]});
  return out;
}

#define QV_INSTANTIATE_SERIES(T)                                                                       \
  template Vector<T> rolling_mean<T>(const Vector<T>&, std::size_t);                                   \
  template Vector<T> diff<T>(const Vector<T>&, std::size_t);                                           \
  template Vector<T> percent_change<T>(const Vector<T>&, std::size_t);                                 \
  template std::vector<HistogramBin<T>> histogram<T>(const Vector<T>&, std::size_t);                   \
  template std::optional<T> percentile<T>(const Vector<T>&, double);                                   \
  template std::optional<Quartiles<T>> quartiles<T>(const Vector<T>&);                                 \
  template T percentile_rank<T>(const Vector<T>&, T);                                                  \
  template Vector<T> percentile_ranks<T>(const Vector<T>&);                                            \
  template Vector<T> scaled<T>(const Vector<T>&, T, T);                                                \
  template Vector<T> as_percentages<T>(const Vector<T>&);                                              \
  template Vector<T> standardized<T>(const Vector<T>&);                                                \
  template std::map<std::string, T> group_by<T>(const Vector<T>&, const std::vector<std::string>&,     \
                                                AggregationMethod);                                    \
  template std::vector<std::pair<std::string, T>> grouped_data<T>(                                     \
      const Vector<T>&, const std::vector<std::string>&, AggregationMethod);                           \
  template Vector<T> downsample<T>(const Vector<T>&, std::size_t, AggregationMethod);                  \
  template Matrix<T> stacked_cumulative<T>(const Matrix<T>&);                                          \
  template Matrix<T> stacked_percentage<T>(const Matrix<T>&);                                          \
  template Matrix<T> correlation_matrix<T>(const Matrix<T>&);                                          \
  template std::vector<HeatmapCell<T>> heatmap_data<T>(const Matrix<T>&, const std::vector<std::string>&);

QV_FOR_FLOATING_TYPES(QV_INSTANTIATE_SERIES)

} // namespace qv
