#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <unordered_map>

#include "convert.hpp"
#include "qv/all.hpp"

namespace py = pybind11;
using namespace qvpy;

namespace {

using PyEmbeddings = std::unordered_map<std::string, List>;

qv::text::Embeddings to_embeddings(const PyEmbeddings& table) {
  qv::text::Embeddings out;
  out.reserve(table.size());
  for (const auto& [word, values] : table) out.emplace(word, vec(values));
  return out;
}

} // namespace

void bind_text(py::module_& m) {
  auto text = m.def_submodule("text", "Tokenization and embedding lookup");

  text.def("tokenize", [](const std::string& s) { return qv::text::tokenize(s); });
  text.def("embed", [](const std::vector<std::string>& tokens, const PyEmbeddings& table) {
    return nested(qv::text::embed(tokens, to_embeddings(table)));
  }, py::arg("tokens"), py::arg("embeddings"));
  text.def("text_vector", [](const std::string& s, const PyEmbeddings& table) -> std::optional<List> {
    auto v = qv::text::text_vector(s, to_embeddings(table));
    if (!v) return std::nullopt;
    return list(std::move(*v));
  }, py::arg("text"), py::arg("embeddings"));
}
