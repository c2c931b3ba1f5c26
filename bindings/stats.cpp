#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "convert.hpp"
#include "qv/all.hpp"

namespace py = pybind11;
using namespace qvpy;

void bind_stats(py::module_& m) {
  // --- statistics ---
  m.def("sum", [](const List& v) { return qv::sum(vec(v)); });
  m.def("product", [](const List& v) { return qv::product(vec(v)); });
  m.def("min", [](const List& v) { return qv::min(vec(v)); });
  m.def("max", [](const List& v) { return qv::max(vec(v)); });
  m.def("argmin", [](const List& v) { return qv::argmin(vec(v)); });
  m.def("argmax", [](const List& v) { return qv::argmax(vec(v)); });
  m.def("mean", [](const List& v) { return qv::mean(vec(v)); });
  m.def("median", [](const List& v) { return qv::median(vec(v)); });
  m.def("variance", [](const List& v, std::size_t ddof) { return qv::variance(vec(v), ddof); },
        py::arg("values"), py::arg("ddof") = 0);
  m.def("std", [](const List& v, std::size_t ddof) { return qv::stddev(vec(v), ddof); },
        py::arg("values"), py::arg("ddof") = 0);
  m.def("cumulative_sum", [](const List& v) { return list(qv::cumulative_sum(vec(v))); });
  m.def("cumulative_product", [](const List& v) { return list(qv::cumulative_product(vec(v))); });
  m.def("outlier_mask", [](const List& v, double threshold, std::optional<double> mean, std::optional<double> sd) {
    return qv::outlier_mask(vec(v), threshold, mean, sd);
  }, py::arg("values"), py::arg("threshold") = 2.0, py::arg("mean") = py::none(), py::arg("std") = py::none());

  // --- comparison / masks ---
  m.def("is_greater_than", [](const List& v, double s) { return qv::is_greater_than(vec(v), s); });
  m.def("is_less_than", [](const List& v, double s) { return qv::is_less_than(vec(v), s); });
  m.def("is_equal", [](const List& a, const List& b) { return qv::is_equal(vec(a), vec(b)); });
  m.def("logical_and", &qv::logical_and);
  m.def("logical_or", &qv::logical_or);
  m.def("logical_not", &qv::logical_not);
  m.def("true_indices", &qv::true_indices);
  m.def("masked", [](const List& v, const qv::Mask& mask) { return list(qv::masked(vec(v), mask)); });
  m.def("choose", [](const List& v, const qv::Mask& cond, const List& other) {
    return list(qv::choose(vec(v), cond, vec(other)));
  });

  // --- generation ---
  m.def("zeros", [](std::size_t n) { return list(qv::zeros<double>(n)); });
  m.def("ones", [](std::size_t n) { return list(qv::ones<double>(n)); });
  m.def("identity", [](std::size_t n) { return nested(qv::identity<double>(n)); });
  m.def("diag", [](const List& v) { return nested(qv::diag(vec(v))); });
  m.def("linspace", [](double a, double b, std::size_t num) { return list(qv::linspace<double>(a, b, num)); },
        py::arg("start"), py::arg("stop"), py::arg("num"));
  m.def("arange", [](double a, double b, double step) { return list(qv::arange<double>(a, b, step)); },
        py::arg("start"), py::arg("stop"), py::arg("step") = 1.0);
  m.def("random", [](std::size_t n) { return list(qv::random<double>(n)); });
  m.def("random_matrix", [](std::size_t r, std::size_t c) { return nested(qv::random<double>(r, c)); });

  // --- series ---
  py::enum_<qv::AggregationMethod>(m, "AggregationMethod")
    .value("sum", qv::AggregationMethod::sum)
    .value("mean", qv::AggregationMethod::mean)
    .value("count", qv::AggregationMethod::count)
    .value("min", qv::AggregationMethod::min)
    .value("max", qv::AggregationMethod::max);

  m.def("rolling_mean", [](const List& v, std::size_t w) { return list(qv::rolling_mean(vec(v), w)); });
  m.def("diff", [](const List& v, std::size_t lag) { return list(qv::diff(vec(v), lag)); },
        py::arg("values"), py::arg("lag") = 1);
  m.def("percent_change", [](const List& v, std::size_t lag) { return list(qv::percent_change(vec(v), lag)); },
        py::arg("values"), py::arg("lag") = 1);
  m.def("histogram", [](const List& v, std::size_t bins) {
    std::vector<std::pair<double, std::size_t>> out;
    for (const auto& b : qv::histogram(vec(v), bins)) out.emplace_back(b.midpoint, b.count);
    return out;
  });
  m.def("percentile", [](const List& v, double p) { return qv::percentile(vec(v), p); });
  m.def("quartiles", [](const List& v) -> py::object {
    const auto q = qv::quartiles(vec(v));
    if (!q) return py::none();
    py::dict d;
    d["min"] = q->min; d["q1"] = q->q1; d["median"] = q->median;
    d["q3"] = q->q3; d["max"] = q->max; d["iqr"] = q->iqr;
    return std::move(d);
  });
  m.def("scaled", [](const List& v, double lo, double hi) { return list(qv::scaled(vec(v), lo, hi)); },
        py::arg("values"), py::arg("low") = 0.0, py::arg("high") = 1.0);
  m.def("standardized", [](const List& v) { return list(qv::standardized(vec(v))); });
  m.def("group_by", [](const List& v, const std::vector<std::string>& cats, qv::AggregationMethod how) {
    return qv::group_by(vec(v), cats, how);
  });
  m.def("downsample", [](const List& v, std::size_t factor, qv::AggregationMethod how) {
    return list(qv::downsample(vec(v), factor, how));
  });
  m.def("correlation_matrix", [](const Nested& s) { return nested(qv::correlation_matrix(mat(s))); });
}
