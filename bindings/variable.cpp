// Python bindings for mos::Variable and the tensor ops (module `mos`).
// The nn submodule is bound in bindings/nn.cpp.
#include <memory>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "mos/all.hpp"

namespace py = pybind11;

// implemented in bindings/nn.cpp
void bind_nn(py::module_ &m);

#ifndef MOS_BINDINGS_VERSION
#define MOS_BINDINGS_VERSION "0.1.0"
#endif

namespace {
// `with mos.nograd():`
struct PyNoGradCtx {
  std::unique_ptr<mos::NoGradGuard> guard;
  PyNoGradCtx() = default;
  PyNoGradCtx& enter() { guard = std::make_unique<mos::NoGradGuard>(); return *this; }
  void exit(py::object, py::object, py::object) { guard.reset(); }
};

py::array_t<double> to_numpy(const std::vector<double>& data, const std::vector<std::size_t>& shape) {
  std::vector<py::ssize_t> dims(shape.begin(), shape.end());
  py::array_t<double> out(dims);
  std::copy(data.begin(), data.end(), out.mutable_data());
  return out;
}
} // anon

PYBIND11_MODULE(mos, m) {
  m.doc() = "Mixture-of-softmaxes recurrent language model";
  m.attr("__version__") = MOS_BINDINGS_VERSION;

  // --- Grad mode ---
  m.def("is_grad_enabled", &mos::is_grad_enabled, "Return global grad mode");
  m.def("set_grad_enabled", &mos::set_grad_enabled, py::arg("enabled"),
        "Enable/disable global grad mode for new nodes");

  py::class_<PyNoGradCtx>(m, "nograd")
      .def(py::init<>())
      .def("__enter__", &PyNoGradCtx::enter, py::return_value_policy::reference_internal)
      .def("__exit__", &PyNoGradCtx::exit);

  // --- RNG ---
  m.def("set_global_seed", &mos::set_global_seed, py::arg("seed"),
        "Seed the generator every dropout mask is drawn from");
  m.def("get_global_seed", &mos::get_global_seed);

  // --- Logging ---
  py::enum_<mos::log::Level>(m, "LogLevel")
    .value("DEBUG", mos::log::Level::Debug)
    .value("INFO", mos::log::Level::Info)
    .value("WARNING", mos::log::Level::Warning)
    .value("ERROR", mos::log::Level::Error);
  m.def("set_log_level", &mos::log::set_level, py::arg("level"));

  // --- Errors ---
  py::register_exception<mos::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
  py::register_exception<mos::ShapeError>(m, "ShapeError", PyExc_ValueError);

  // --- Variable ---
  py::class_<mos::Variable>(m, "Variable")
    .def(py::init<const std::vector<double>&, const std::vector<std::size_t>&, bool>(),
         py::arg("value"), py::arg("shape"), py::arg("requires_grad") = false)
    .def_static("from_numpy", [](py::array_t<double, py::array::c_style | py::array::forcecast> arr, bool requires_grad){
        py::buffer_info info = arr.request();
        std::vector<double> data((double*)info.ptr, (double*)info.ptr + info.size);
        std::vector<std::size_t> shape(info.shape.begin(), info.shape.end());
        return mos::Variable(data, shape, requires_grad);
    }, py::arg("array"), py::arg("requires_grad") = false)
    .def("numpy", [](const mos::Variable& v){ return to_numpy(v.value(), v.shape()); })
    .def("grad_numpy", [](const mos::Variable& v){ return to_numpy(v.grad(), v.shape()); })
    .def("value", [](const mos::Variable& v){ return v.value(); })
    .def("grad", [](const mos::Variable& v){ return v.grad(); })
    .def("shape", [](const mos::Variable& v){ return v.shape(); })
    .def("numel", &mos::Variable::numel)
    .def("requires_grad", &mos::Variable::requires_grad)
    .def("shares_storage", &mos::Variable::shares_storage, py::arg("other"))
    .def("assign", [](mos::Variable& v, const std::vector<double>& values){
        if (values.size() != v.numel()) throw std::invalid_argument("assign: size mismatch");
        v.mutable_value() = values;
    }, py::arg("values"), "Overwrite values in place (visible through every alias)")
    .def("zero_grad", [](mos::Variable& v){ v.zero_grad(); })
    .def("backward", [](mos::Variable& v){ v.backward(); })
    .def("backward", [](mos::Variable& v, const std::vector<double>& seed){ v.backward(seed); }, py::arg("seed"))
    .def("__add__", [](const mos::Variable& a, const mos::Variable& b){ return mos::add(a, b); })
    .def("__sub__", [](const mos::Variable& a, const mos::Variable& b){ return mos::sub(a, b); })
    .def("__mul__", [](const mos::Variable& a, const mos::Variable& b){ return mos::mul(a, b); })
    .def("__truediv__", [](const mos::Variable& a, const mos::Variable& b){ return mos::div(a, b); })
    .def("__neg__", [](const mos::Variable& a){ return mos::neg(a); })
    .def("__matmul__", [](const mos::Variable& a, const mos::Variable& b){ return mos::matmul(a, b); })
    .def_property_readonly("T", [](const mos::Variable& v){ return mos::t(v); })
    .def("__repr__", [](const mos::Variable& v){
        std::string s = "Variable(shape=[";
        for (std::size_t i = 0; i < v.shape().size(); ++i) s += (i ? ", " : "") + std::to_string(v.shape()[i]);
        return s + "], requires_grad=" + (v.requires_grad() ? "True" : "False") + ")";
    });

  // --- Graph helpers ---
  m.def("stop_gradient", &mos::stop_gradient, py::arg("x"));
  m.def("detach", &mos::detach, py::arg("x"));

  // Elementwise
  m.def("add", &mos::add, "Elementwise add", py::arg("a"), py::arg("b"));
  m.def("sub", &mos::sub, "Elementwise subtract", py::arg("a"), py::arg("b"));
  m.def("mul", &mos::mul, "Elementwise multiply", py::arg("a"), py::arg("b"));
  m.def("div", &mos::div, "Elementwise divide", py::arg("a"), py::arg("b"));
  m.def("neg", &mos::neg, "Elementwise negate", py::arg("x"));
  m.def("exp", &mos::expv, "Elementwise exp", py::arg("x"));

  // Activations
  m.def("sigmoid", &mos::sigmoid, py::arg("x"));
  m.def("tanh", &mos::tanhv, py::arg("x"));
  m.def("log",  &mos::logv,  py::arg("x"));

  // Linalg
  m.def("matmul", &mos::matmul, py::arg("A"), py::arg("B"));
  m.def("transpose", &mos::transpose, py::arg("x"), py::arg("axes"));

  // Reductions / stats
  m.def("reduce_sum", &mos::reduce_sum, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);
  m.def("reduce_max", &mos::reduce_max, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);
  m.def("logsumexp", &mos::logsumexp, py::arg("x"), py::arg("axes") = std::vector<int>{}, py::arg("keepdims") = false);
  m.def("softmax", &mos::softmax, py::arg("x"), py::arg("axis") = -1);

  // Reshape
  m.def("flatten", &mos::flatten, py::arg("x"), py::arg("start_dim") = std::size_t{1});
  m.def("reshape", &mos::reshape, py::arg("x"), py::arg("new_shape"));
  m.def("concat", &mos::concat, py::arg("xs"), py::arg("axis") = std::size_t{0});

  bind_nn(m);
}
