#include "test_framework.hpp"
#include "qv/ops/series.hpp"
#include "qv/parallel/config.hpp"

#include <cmath>
#include <string>
#include <vector>

using qv::AggregationMethod;
using qv::Matrix;
using qv::Vector;

TEST("ops/series/rolling_mean") {
  Vector<double> v{1, 2, 3, 4, 5};
  ASSERT_ALLCLOSE_VEC(qv::rolling_mean(v, 3), (std::vector<double>{1, 1.5, 2, 3, 4}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(qv::rolling_mean(v, 1), v, 0, 0);
  // wider than the data: every point is the overall mean
  ASSERT_ALLCLOSE_VEC(qv::rolling_mean(v, 9), (std::vector<double>{3, 3, 3, 3, 3}), 1e-12, 0);
  ASSERT_TRUE(qv::rolling_mean(v, 0).empty());
}

TEST("ops/series/diff_and_percent_change") {
  Vector<double> v{10, 12, 9, 9};
  ASSERT_ALLCLOSE_VEC(qv::diff(v), (std::vector<double>{2, -3, 0}), 0, 0);
  ASSERT_ALLCLOSE_VEC(qv::diff(v, 2), (std::vector<double>{-1, -3}), 0, 0);
  ASSERT_TRUE(qv::diff(v, 4).empty());
  ASSERT_ALLCLOSE_VEC(qv::percent_change(v), (std::vector<double>{20, -25, 0}), 1e-12, 0);
  // previous value of zero reports 0
  ASSERT_ALLCLOSE_VEC(qv::percent_change(Vector<double>{0, 5}), (std::vector<double>{0}), 0, 0);
}

TEST("ops/series/histogram") {
  Vector<double> v{0, 1, 2, 3, 4, 5, 6, 7, 8, 10};
  auto bins = qv::histogram(v, 5);
  ASSERT_EQ(bins.size(), 5u);
  ASSERT_NEAR(bins[0].midpoint, 1.0, 1e-12);
  ASSERT_EQ(bins[0].count, 2u);
  ASSERT_EQ(bins[3].count, 2u);
  // top edge lands in the closed last bin
  ASSERT_EQ(bins[4].count, 2u);
  std::size_t total = 0;
  for (const auto& b : bins) total += b.count;
  ASSERT_EQ(total, v.size());

  auto flat = qv::histogram(Vector<double>{4, 4, 4}, 3);
  ASSERT_EQ(flat.size(), 1u);
  ASSERT_EQ(flat[0].count, 3u);
  ASSERT_TRUE(qv::histogram(Vector<double>{}, 3).empty());
}

TEST("ops/series/percentiles") {
  Vector<double> v{1, 2, 3, 4, 5};
  ASSERT_NEAR(*qv::percentile(v, 0), 1.0, 0.0);
  ASSERT_NEAR(*qv::percentile(v, 50), 3.0, 1e-12);
  ASSERT_NEAR(*qv::percentile(v, 100), 5.0, 0.0);
  ASSERT_NEAR(*qv::percentile(Vector<double>{1, 2, 3, 4}, 25), 1.75, 1e-12);
  ASSERT_FALSE(qv::percentile(v, 101).has_value());
  ASSERT_FALSE(qv::percentile(Vector<double>{}, 50).has_value());

  auto q = qv::quartiles(v);
  ASSERT_TRUE(q.has_value());
  ASSERT_NEAR(q->min, 1.0, 0.0);
  ASSERT_NEAR(q->q1, 2.0, 1e-12);
  ASSERT_NEAR(q->median, 3.0, 1e-12);
  ASSERT_NEAR(q->q3, 4.0, 1e-12);
  ASSERT_NEAR(q->max, 5.0, 0.0);
  ASSERT_NEAR(q->iqr, 2.0, 1e-12);
}

TEST("ops/series/percentile_rank") {
  Vector<double> v{1, 2, 2, 3};
  ASSERT_NEAR(qv::percentile_rank(v, 2.0), 50.0, 1e-12);
  ASSERT_NEAR(qv::percentile_rank(v, 0.0), 0.0, 0.0);
  ASSERT_NEAR(qv::percentile_rank(v, 9.0), 100.0, 1e-12);
  ASSERT_ALLCLOSE_VEC(qv::percentile_ranks(v), (std::vector<double>{12.5, 50, 50, 87.5}), 1e-12, 0);
}

TEST("ops/series/scaling") {
  Vector<double> v{2, 4, 6};
  ASSERT_ALLCLOSE_VEC(qv::scaled(v, 0.0, 1.0), (std::vector<double>{0, 0.5, 1}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(qv::scaled(Vector<double>{3, 3}, 5.0, 9.0), (std::vector<double>{5, 5}), 0, 0);
  ASSERT_ALLCLOSE_VEC(qv::as_percentages(Vector<double>{1, 3}), (std::vector<double>{25, 75}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(qv::as_percentages(Vector<double>{0, 0}), (std::vector<double>{0, 0}), 0, 0);

  auto z = qv::standardized(v);
  const double s = std::sqrt(8.0 / 3.0);
  ASSERT_ALLCLOSE_VEC(z, (std::vector<double>{-2 / s, 0, 2 / s}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(qv::standardized(Vector<double>{7, 7}), (std::vector<double>{0, 0}), 0, 0);
}

TEST("ops/series/group_by") {
  Vector<double> values{1, 2, 3, 4, 5};
  std::vector<std::string> cats{"b", "a", "b", "a", "c"};
  auto sums = qv::group_by(values, cats, AggregationMethod::sum);
  ASSERT_EQ(sums.size(), 3u);
  ASSERT_NEAR(sums.at("a"), 6.0, 0.0);
  ASSERT_NEAR(sums.at("b"), 4.0, 0.0);
  ASSERT_NEAR(sums.at("c"), 5.0, 0.0);

  auto counts = qv::group_by(values, cats, AggregationMethod::count);
  ASSERT_NEAR(counts.at("a"), 2.0, 0.0);
  auto maxes = qv::group_by(values, cats, AggregationMethod::max);
  ASSERT_NEAR(maxes.at("b"), 3.0, 0.0);

  auto rows = qv::grouped_data(values, cats, AggregationMethod::mean);
  ASSERT_EQ(rows.size(), 3u);
  ASSERT_EQ(rows[0].first, std::string("a"));
  ASSERT_NEAR(rows[0].second, 3.0, 1e-12);
  ASSERT_EQ(rows[2].first, std::string("c"));

  ASSERT_TRUE(qv::group_by(values, std::vector<std::string>{"a"}, AggregationMethod::sum).empty());
}

TEST("ops/series/downsample") {
  Vector<double> v{1, 2, 3, 4, 5};
  ASSERT_ALLCLOSE_VEC(qv::downsample(v, 2, AggregationMethod::sum), (std::vector<double>{3, 7, 5}), 0, 0);
  ASSERT_ALLCLOSE_VEC(qv::downsample(v, 2, AggregationMethod::mean), (std::vector<double>{1.5, 3.5, 5}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(qv::downsample(v, 10, AggregationMethod::max), (std::vector<double>{5}), 0, 0);
  ASSERT_TRUE(qv::downsample(v, 0, AggregationMethod::sum).empty());
}

TEST("ops/series/stacking") {
  Matrix<double> series{{1, 2}, {3, 2}};
  auto cum = qv::stacked_cumulative(series);
  ASSERT_ALLCLOSE_VEC(cum[0], (std::vector<double>{1, 2}), 0, 0);
  ASSERT_ALLCLOSE_VEC(cum[1], (std::vector<double>{4, 4}), 0, 0);

  auto pct = qv::stacked_percentage(series);
  ASSERT_ALLCLOSE_VEC(pct[0], (std::vector<double>{25, 50}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(pct[1], (std::vector<double>{75, 50}), 1e-12, 0);

  // a longer series contributes nothing to the totals and reports 0 past them
  Matrix<double> mixed(std::vector<std::vector<double>>{{1, 1}, {1, 3, 5}});
  auto cum_mixed = qv::stacked_cumulative(mixed);
  ASSERT_EQ(cum_mixed.row_count(), 1u);
  auto pct_mixed = qv::stacked_percentage(mixed);
  ASSERT_ALLCLOSE_VEC(pct_mixed[0], (std::vector<double>{100, 100}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(pct_mixed[1], (std::vector<double>{100, 300, 0}), 1e-12, 0);
}

TEST("ops/series/correlation") {
  Matrix<double> series{{1, 2, 3, 4}, {2, 4, 6, 8}, {4, 3, 2, 1}, {5, 5, 5, 5}};
  auto corr = qv::correlation_matrix(series);
  ASSERT_EQ(corr.row_count(), 4u);
  ASSERT_NEAR(corr[0][0], 1.0, 0.0);
  ASSERT_NEAR(corr[0][1], 1.0, 1e-12);
  ASSERT_NEAR(corr[0][2], -1.0, 1e-12);
  // constant series has no defined correlation
  ASSERT_NEAR(corr[0][3], 0.0, 0.0);
  ASSERT_NEAR(corr[3][3], 1.0, 0.0);

  Matrix<double> serial;
  {
    qv::parallel::ScopedSerial guard;
    serial = qv::correlation_matrix(series);
  }
  ASSERT_TRUE(serial == corr);

  auto cells = qv::heatmap_data(series, {"a", "b", "c", "d"});
  ASSERT_EQ(cells.size(), 16u);
  ASSERT_EQ(cells[2].x, std::string("a"));
  ASSERT_EQ(cells[2].y, std::string("c"));
  ASSERT_NEAR(cells[2].value, -1.0, 1e-12);
  ASSERT_TRUE(qv::heatmap_data(series, {"a"}).empty());
}
