#include "test_framework.hpp"
#include "qv/core/errors.hpp"
#include "qv/ops/generate.hpp"

#include <stdexcept>
#include <vector>

using qv::Matrix;
using qv::Vector;

TEST("ops/generate/fills") {
  ASSERT_TRUE(qv::zeros<double>(3) == (Vector<double>{0, 0, 0}));
  ASSERT_TRUE(qv::ones<int>(2) == (Vector<int>{1, 1}));
  ASSERT_TRUE(qv::full<double>(2, 7.5) == (Vector<double>{7.5, 7.5}));
  ASSERT_TRUE(qv::zeros<double>(0).empty());

  auto m = qv::full<int>(2, 3, 4);
  ASSERT_EQ(m.row_count(), 2u);
  ASSERT_EQ(m.column_count(), 3u);
  ASSERT_EQ(m[1][2], 4);
  ASSERT_EQ(qv::ones<double>(1, 1)[0][0], 1.0);
}

TEST("ops/generate/identity_and_diag") {
  auto eye = qv::identity<int>(3);
  ASSERT_TRUE(eye == (Matrix<int>{{1, 0, 0}, {0, 1, 0}, {0, 0, 1}}));
  ASSERT_THROWS_AS(qv::identity<int>(0), qv::EmptyInput);

  auto d = qv::diag(Vector<double>{2, 3});
  ASSERT_TRUE(d == (Matrix<double>{{2, 0}, {0, 3}}));
  ASSERT_THROWS_AS(qv::diag(Vector<double>{}), qv::EmptyInput);
}

TEST("ops/generate/linspace") {
  ASSERT_ALLCLOSE_VEC(qv::linspace<double>(0, 1, 5), (std::vector<double>{0, 0.25, 0.5, 0.75, 1}), 1e-12, 0);
  ASSERT_ALLCLOSE_VEC(qv::linspace<double>(3, 9, 1), (std::vector<double>{3}), 0, 0);
  ASSERT_ALLCLOSE_VEC(qv::linspace<double>(1, -1, 3), (std::vector<double>{1, 0, -1}), 1e-12, 0);
  ASSERT_THROWS_AS(qv::linspace<double>(0, 1, 0), qv::EmptyInput);
}

TEST("ops/generate/arange") {
  ASSERT_TRUE(qv::arange<int>(0, 5) == (Vector<int>{0, 1, 2, 3, 4}));
  ASSERT_TRUE(qv::arange<int>(5, 0, -2) == (Vector<int>{5, 3, 1}));
  ASSERT_ALLCLOSE_VEC(qv::arange<double>(0, 1, 0.25), (std::vector<double>{0, 0.25, 0.5, 0.75}), 1e-12, 0);
  ASSERT_TRUE(qv::arange<int>(3, 3).empty());
  ASSERT_TRUE(qv::arange<int>(5, 0).empty());
  ASSERT_THROWS_AS(qv::arange<int>(0, 5, 0), std::invalid_argument);
}

TEST("ops/generate/random_range") {
  auto v = qv::random<double>(1000);
  ASSERT_EQ(v.size(), 1000u);
  for (double x : v) {
    ASSERT_GE(x, 0.0);
    ASSERT_LT(x, 1.0);
  }
  auto m = qv::random<float>(3, 4);
  ASSERT_EQ(m.row_count(), 3u);
  ASSERT_EQ(m.column_count(), 4u);
  ASSERT_THROWS_AS(qv::random<double>(0, 4), qv::EmptyInput);
  ASSERT_TRUE(qv::random<double>(0).empty());
}
