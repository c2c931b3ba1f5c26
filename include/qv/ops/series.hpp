#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "qv/core/matrix.hpp"
#include "qv/core/vector.hpp"

// Series helpers for charting and summary tables (float/double only).
// Degenerate input yields an empty or neutral result rather than an error.

namespace qv {

enum class AggregationMethod { sum, mean, count, min, max };

template <class T>
struct HistogramBin {
  T midpoint;
  std::size_t count;
};

template <class T>
struct Quartiles {
  T min, q1, median, q3, max, iqr;
};

template <class T>
struct HeatmapCell {
  std::string x;
  std::string y;
  T value;
};

// ---- time series ----

// Trailing mean over up to `window` points. window > size() repeats the
// overall mean; window == 0 or empty input gives [].
template <class T> Vector<T> rolling_mean(const Vector<T>& v, std::size_t window);

// v[i] - v[i-lag] for i >= lag; [] unless 0 < lag < size().
template <class T> Vector<T> diff(const Vector<T>& v, std::size_t lag = 1);

// Percent change against v[i-lag]; 0 where the previous value is 0.
template <class T> Vector<T> percent_change(const Vector<T>& v, std::size_t lag = 1);

// ---- distribution ----

// `bins` equal-width bins over [min, max]; the last bin is closed. Constant
// input gives one (min, size()) bin.
template <class T> std::vector<HistogramBin<T>> histogram(const Vector<T>& v, std::size_t bins);

// Linear interpolation between closest ranks; nullopt if empty or p outside [0, 100].
template <class T> std::optional<T> percentile(const Vector<T>& v, double p);
template <class T> std::optional<Quartiles<T>> quartiles(const Vector<T>& v);

// (count below + count equal / 2) / n * 100; 0 for empty input.
template <class T> T percentile_rank(const Vector<T>& v, T value);
template <class T> Vector<T> percentile_ranks(const Vector<T>& v);

// ---- scaling ----

// Min-max scaling into [lo, hi]; constant input maps to lo.
template <class T> Vector<T> scaled(const Vector<T>& v, T lo, T hi);
template <class T> Vector<T> as_percentages(const Vector<T>& v);
// z-scores using the population standard deviation; zeros if it is 0.
template <class T> Vector<T> standardized(const Vector<T>& v);

// ---- grouping ----

// Aggregate values by category label; empty when the lengths differ.
template <class T>
std::map<std::string, T> group_by(const Vector<T>& values, const std::vector<std::string>& categories,
                                  AggregationMethod method);

// group_by as (category, value) pairs in ascending category order.
template <class T>
std::vector<std::pair<std::string, T>> grouped_data(const Vector<T>& values,
                                                    const std::vector<std::string>& categories,
                                                    AggregationMethod method);

// Aggregate consecutive chunks of `factor` points (last chunk may be short).
template <class T> Vector<T> downsample(const Vector<T>& v, std::size_t factor, AggregationMethod method);

// ---- multi-series (one series per matrix row; rows may differ in length) ----

// Running totals across series. Series whose length differs from the first
// are skipped.
template <class T> Matrix<T> stacked_cumulative(const Matrix<T>& series);

// Each point as a percentage of the per-point total over all series.
// Mismatched series add nothing to the totals; points past the first
// series' length report 0.
template <class T> Matrix<T> stacked_percentage(const Matrix<T>& series);

// Pearson correlation for every pair of series, 1 on the diagonal, 0 for
// degenerate pairs. Rows are computed on the parallel pool.
template <class T> Matrix<T> correlation_matrix(const Matrix<T>& series);

// correlation_matrix flattened to (label_i, label_j, r) cells; empty when the
// label count differs from the series count.
template <class T>
std::vector<HeatmapCell<T>> heatmap_data(const Matrix<T>& series, const std::vector<std::string>& labels);

} // namespace qv
