#include "test_framework.hpp"
#include "qv/ops/stats.hpp"

#include <cmath>
#include <optional>
#include <vector>

using qv::Matrix;
using qv::Vector;

TEST("ops/stats/sum_and_product") {
  ASSERT_NEAR(qv::sum(Vector<double>{1, 2, 3, 4}), 10.0, 0.0);
  ASSERT_EQ(qv::sum(Vector<int>{}), 0);
  ASSERT_EQ(qv::product(Vector<int>{2, 3, 4}), 24);
  // empty product is 0, not the multiplicative identity
  ASSERT_EQ(qv::product(Vector<int>{}), 0);
  ASSERT_NEAR(qv::product(Vector<double>{}), 0.0, 0.0);
}

TEST("ops/stats/extremes_first_wins") {
  Vector<double> v{3, 1, 4, 1, 5, 9, 2, 9};
  ASSERT_NEAR(*qv::min(v), 1.0, 0.0);
  ASSERT_NEAR(*qv::max(v), 9.0, 0.0);
  ASSERT_EQ(*qv::argmin(v), 1u);
  ASSERT_EQ(*qv::argmax(v), 5u);

  Vector<double> empty;
  ASSERT_FALSE(qv::min(empty).has_value());
  ASSERT_FALSE(qv::argmax(empty).has_value());
}

TEST("ops/stats/cumulative") {
  ASSERT_TRUE(qv::cumulative_sum(Vector<int>{1, 2, 3, 4}) == (Vector<int>{1, 3, 6, 10}));
  ASSERT_TRUE(qv::cumulative_product(Vector<int>{1, 2, 3, 4}) == (Vector<int>{1, 2, 6, 24}));
  ASSERT_TRUE(qv::cumulative_sum(Vector<int>{}).empty());
}

TEST("ops/stats/mean_median") {
  ASSERT_NEAR(*qv::mean(Vector<double>{1, 2, 3, 4}), 2.5, 1e-12);
  ASSERT_NEAR(*qv::median(Vector<double>{5, 1, 3}), 3.0, 0.0);
  ASSERT_NEAR(*qv::median(Vector<double>{4, 1, 3, 2}), 2.5, 0.0);
  ASSERT_FALSE(qv::mean(Vector<double>{}).has_value());
  ASSERT_FALSE(qv::median(Vector<double>{}).has_value());
}

TEST("ops/stats/variance_ddof") {
  Vector<double> v{1, 2, 3, 4, 5};
  ASSERT_NEAR(*qv::variance(v), 2.0, 1e-12);
  ASSERT_NEAR(*qv::variance(v, 1), 2.5, 1e-12);
  ASSERT_NEAR(*qv::stddev(v), std::sqrt(2.0), 1e-12);
  ASSERT_NEAR(*qv::stddev(v, 1), std::sqrt(2.5), 1e-12);

  ASSERT_FALSE(qv::variance(Vector<double>{7}, 1).has_value());
  ASSERT_NEAR(*qv::variance(Vector<double>{7}), 0.0, 0.0);
  ASSERT_FALSE(qv::stddev(Vector<double>{}).has_value());
}

TEST("ops/stats/outlier_mask") {
  Vector<double> v{10, 10, 10, 10, 10, 10, 10, 10, 10, 100};
  auto mask = qv::outlier_mask(v);
  ASSERT_EQ(mask.size(), v.size());
  ASSERT_TRUE(mask[9]);
  ASSERT_FALSE(mask[0]);

  // explicit center and spread
  auto custom = qv::outlier_mask(Vector<double>{0, 1, 5}, 1.0, std::optional<double>(1.0),
                                  std::optional<double>(1.0));
  ASSERT_TRUE(custom[0] == false);
  ASSERT_TRUE(custom[1] == false);
  ASSERT_TRUE(custom[2] == true);

  ASSERT_TRUE(qv::outlier_mask(Vector<double>{}).empty());
  // a lone value has zero spread and is never an outlier
  ASSERT_TRUE(qv::outlier_mask(Vector<double>{42}) == qv::Mask{false});
}

TEST("ops/stats/mean_vector") {
  Matrix<double> rows{{1, 2}, {3, 4}, {5, 6}};
  auto m = qv::mean_vector(rows);
  ASSERT_TRUE(m.has_value());
  ASSERT_ALLCLOSE_VEC(*m, (std::vector<double>{3, 4}), 1e-12, 0);

  ASSERT_FALSE(qv::mean_vector(Matrix<double>{}).has_value());
  Matrix<double> ragged(std::vector<std::vector<double>>{{1, 2}, {3}});
  ASSERT_FALSE(qv::mean_vector(ragged).has_value());
}
