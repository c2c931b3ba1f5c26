#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "convert.hpp"
#include "qv/all.hpp"

namespace py = pybind11;
using namespace qvpy;

void bind_stats(py::module_& m);
void bind_text(py::module_& m);

PYBIND11_MODULE(quiver, m) {
  m.doc() = "Vector, matrix and statistics kernels over Python lists";
  m.attr("__version__") = QV_VERSION;

  // --- errors ---
  py::register_exception<qv::DimensionMismatch>(m, "DimensionMismatch", PyExc_ValueError);
  py::register_exception<qv::ZeroVector>(m, "ZeroVector", PyExc_ValueError);
  py::register_exception<qv::EmptyInput>(m, "EmptyInput", PyExc_ValueError);
  py::register_exception<qv::DivisionByZero>(m, "DivisionByZero", PyExc_ZeroDivisionError);

  // --- runtime knobs ---
  m.def("set_max_threads", &qv::parallel::set_max_threads, py::arg("n"));
  m.def("get_max_threads", &qv::parallel::get_max_threads);
  m.def("set_deterministic", &qv::parallel::set_deterministic, py::arg("on"));
  m.def("set_log_level", [](const std::string& name) {
    qv::logging::set_level(qv::logging::parse_level(name.c_str(), qv::logging::level()));
  }, py::arg("level"));

  // --- element-wise ---
  m.def("add", [](const List& a, const List& b) { return list(qv::add(vec(a), vec(b))); });
  m.def("subtract", [](const List& a, const List& b) { return list(qv::sub(vec(a), vec(b))); });
  m.def("multiply", [](const List& a, const List& b) { return list(qv::mul(vec(a), vec(b))); });
  m.def("divide", [](const List& a, const List& b) { return list(qv::div(vec(a), vec(b))); });
  m.def("matrix_add", [](const Nested& a, const Nested& b) { return nested(qv::add(mat(a), mat(b))); });
  m.def("matrix_subtract", [](const Nested& a, const Nested& b) { return nested(qv::sub(mat(a), mat(b))); });
  m.def("hadamard", [](const Nested& a, const Nested& b) { return nested(qv::mul(mat(a), mat(b))); });
  m.def("matrix_divide", [](const Nested& a, const Nested& b) { return nested(qv::div(mat(a), mat(b))); });

  m.def("power", [](const List& v, double e) { return list(qv::power(vec(v), e)); }, py::arg("values"), py::arg("exponent"));
  m.def("sqrt", [](const List& v) { return list(qv::sqrt(vec(v))); });
  m.def("exp", [](const List& v) { return list(qv::exp(vec(v))); });
  m.def("log", [](const List& v) { return list(qv::log(vec(v))); });
  m.def("sin", [](const List& v) { return list(qv::sin(vec(v))); });
  m.def("cos", [](const List& v) { return list(qv::cos(vec(v))); });

  // --- broadcasting ---
  m.def("broadcast_add", [](const List& v, double s) { return list(qv::broadcast_add(vec(v), s)); });
  m.def("broadcast_subtract", [](const List& v, double s) { return list(qv::broadcast_sub(vec(v), s)); });
  m.def("broadcast_multiply", [](const List& v, double s) { return list(qv::broadcast_mul(vec(v), s)); });
  m.def("broadcast_divide", [](const List& v, double s) { return list(qv::broadcast_div(vec(v), s)); });
  m.def("scalar_subtract", [](double s, const List& v) { return list(qv::scalar_sub(s, vec(v))); });
  m.def("scalar_divide", [](double s, const List& v) { return list(qv::scalar_div(s, vec(v))); });
  m.def("broadcast", [](const List& v, double s, const std::function<double(double, double)>& op) {
    return list(qv::broadcast(vec(v), s, op));
  }, py::arg("values"), py::arg("scalar"), py::arg("op"));
  m.def("add_to_each_row", [](const Nested& a, const List& v) { return nested(qv::add_to_each_row(mat(a), vec(v))); });
  m.def("multiply_each_row", [](const Nested& a, const List& v) { return nested(qv::multiply_each_row(mat(a), vec(v))); });
  m.def("add_to_each_column", [](const Nested& a, const List& v) { return nested(qv::add_to_each_column(mat(a), vec(v))); });
  m.def("multiply_each_column", [](const Nested& a, const List& v) { return nested(qv::multiply_each_column(mat(a), vec(v))); });

  // --- vector algebra ---
  m.def("dot", [](const List& a, const List& b) { return qv::dot(vec(a), vec(b)); });
  m.def("magnitude", [](const List& v) { return qv::magnitude(vec(v)); });
  m.def("normalized", [](const List& v) { return list(qv::normalized(vec(v))); });
  m.def("cosine_of_angle", [](const List& a, const List& b) { return qv::cosine_of_angle(vec(a), vec(b)); });
  m.def("angle", [](const List& a, const List& b) { return qv::angle(vec(a), vec(b)); });
  m.def("angle_in_degrees", [](const List& a, const List& b) { return qv::angle_in_degrees(vec(a), vec(b)); });
  m.def("distance", [](const List& a, const List& b) { return qv::distance(vec(a), vec(b)); });
  m.def("scalar_projection", [](const List& a, const List& b) { return qv::scalar_projection(vec(a), vec(b)); });
  m.def("vector_projection", [](const List& a, const List& b) { return list(qv::vector_projection(vec(a), vec(b))); });
  m.def("orthogonal_component", [](const List& a, const List& b) {
    return list(qv::orthogonal_component(vec(a), vec(b)));
  });

  // --- similarity / ranking ---
  m.def("cosine_similarities", [](const Nested& db, const List& q) {
    return list(qv::cosine_similarities(mat(db), vec(q)));
  }, py::arg("database"), py::arg("query"));
  m.def("find_duplicates", [](const Nested& db, double threshold) {
    std::vector<std::tuple<std::size_t, std::size_t, double>> out;
    for (const auto& p : qv::find_duplicates(mat(db), threshold)) out.emplace_back(p.first, p.second, p.similarity);
    return out;
  }, py::arg("database"), py::arg("threshold") = 0.95);
  m.def("cluster_cohesion", [](const Nested& items) { return qv::cluster_cohesion(mat(items)); });
  m.def("top_indices", [](const List& scores, std::size_t k) {
    std::vector<std::pair<std::size_t, double>> out;
    for (const auto& hit : qv::top_indices(vec(scores), k)) out.emplace_back(hit.index, hit.score);
    return out;
  }, py::arg("scores"), py::arg("k"));
  m.def("top_labels", [](const List& scores, std::size_t k, const std::vector<std::string>& labels) {
    return qv::top_indices(vec(scores), k, labels);
  }, py::arg("scores"), py::arg("k"), py::arg("labels"));
  m.def("averaged", [](const Nested& rows) -> std::optional<List> {
    auto avg = qv::averaged(mat(rows));
    if (!avg) return std::nullopt;
    return list(std::move(*avg));
  });

  // --- matrix algebra ---
  m.def("transpose", [](const Nested& a) { return nested(qv::transpose(mat(a))); });
  m.def("multiply_matrix", [](const Nested& a, const Nested& b) { return nested(qv::multiply_matrix(mat(a), mat(b))); });
  m.def("transform", [](const Nested& a, const List& v) { return list(qv::transform(mat(a), vec(v))); },
        py::arg("matrix"), py::arg("vector"));
  m.def("column", [](const Nested& a, std::size_t j) { return list(qv::column(mat(a), j)); });
  m.def("shape", [](const Nested& a) { return qv::shape(mat(a)); });
  m.def("is_ragged", [](const Nested& a) { return qv::is_ragged(mat(a)); });
  m.def("info", [](const List& v) { return qv::info(vec(v)); });

  bind_stats(m);
  bind_text(m);
}
