#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "mos/all.hpp"

namespace py = pybind11;

namespace {

py::list hidden_to_py(const std::vector<mos::nn::RecurrentState>& hidden) {
  py::list out;
  for (const auto& s : hidden) out.append(py::make_tuple(s.h, s.c));
  return out;
}

std::vector<mos::nn::RecurrentState> hidden_from_py(const py::sequence& seq) {
  std::vector<mos::nn::RecurrentState> hidden;
  hidden.reserve(seq.size());
  for (auto item : seq) {
    auto pair = item.cast<std::pair<mos::Variable, mos::Variable>>();
    hidden.push_back({pair.first, pair.second});
  }
  return hidden;
}

// Accepts a T x B nested sequence of ints.
mos::nn::Tokens tokens_from_py(const py::sequence& rows) {
  mos::nn::Tokens t;
  t.steps = rows.size();
  for (auto row : rows) {
    auto ids = row.cast<std::vector<std::size_t>>();
    if (t.batch == 0) t.batch = ids.size();
    if (ids.size() != t.batch) throw mos::ShapeError("tokens: ragged rows");
    t.ids.insert(t.ids.end(), ids.begin(), ids.end());
  }
  return t;
}

} // namespace

void bind_nn(py::module_ &m) {
  using namespace mos::nn;
  auto nn = m.def_submodule("nn", "Model and layers");

  py::enum_<Mode>(nn, "Mode")
    .value("Train", Mode::Train)
    .value("Eval", Mode::Eval)
    .value("EvalMonteCarlo", Mode::EvalMonteCarlo);

  py::class_<ModelConfig>(nn, "ModelConfig")
    .def(py::init<>())
    .def_readwrite("ntoken", &ModelConfig::ntoken)
    .def_readwrite("ninp", &ModelConfig::ninp)
    .def_readwrite("nhid", &ModelConfig::nhid)
    .def_readwrite("nhidlast", &ModelConfig::nhidlast)
    .def_readwrite("nlayers", &ModelConfig::nlayers)
    .def_readwrite("dropout", &ModelConfig::dropout)
    .def_readwrite("dropouth", &ModelConfig::dropouth)
    .def_readwrite("dropouti", &ModelConfig::dropouti)
    .def_readwrite("dropoute", &ModelConfig::dropoute)
    .def_readwrite("wdrop", &ModelConfig::wdrop)
    .def_readwrite("dropoutl", &ModelConfig::dropoutl)
    .def_readwrite("n_experts", &ModelConfig::n_experts)
    .def_readwrite("tie_weights", &ModelConfig::tie_weights)
    .def_readwrite("use_dropout", &ModelConfig::use_dropout)
    .def_readwrite("nlatent", &ModelConfig::nlatent)
    .def("validate", &ModelConfig::validate);

  py::class_<Tokens>(nn, "Tokens")
    .def(py::init<std::vector<std::size_t>, std::size_t, std::size_t>(),
         py::arg("ids"), py::arg("steps"), py::arg("batch"))
    .def_static("from_rows", &tokens_from_py, py::arg("rows"))
    .def_readonly("ids", &Tokens::ids)
    .def_readonly("steps", &Tokens::steps)
    .def_readonly("batch", &Tokens::batch);

  py::class_<Module, std::shared_ptr<Module>>(nn, "Module")
    .def("parameters", [](Module& self){
      std::vector<mos::Variable> out;
      for (auto* p : self.parameters()) out.push_back(*p);
      return out;
    })
    .def("named_parameters", [](Module& self, const std::string& prefix){
      std::vector<std::pair<std::string, mos::Variable>> out;
      for (auto& kv : self.named_parameters(prefix)) out.emplace_back(kv.first, *kv.second);
      return out;
    }, py::arg("prefix") = "")
    .def("num_parameters", &Module::num_parameters)
    .def("zero_grad", &Module::zero_grad)
    .def("train", [](Module& self, bool mode){ if (mode) self.train(); else self.eval(); }, py::arg("mode") = true)
    .def("eval", &Module::eval)
    .def_property_readonly("training", &Module::training);

  py::class_<RNNModel, Module, std::shared_ptr<RNNModel>>(nn, "RNNModel")
    .def(py::init<const ModelConfig&>(), py::arg("config"))
    .def("forward", [](RNNModel& self, const Tokens& tokens, const py::sequence& hidden, bool return_h, bool return_prob){
      auto out = self.forward(tokens, hidden_from_py(hidden), return_h, return_prob);
      if (return_h)
        return py::make_tuple(out.output, hidden_to_py(out.hidden), out.raw_outputs, out.outputs);
      return py::make_tuple(out.output, hidden_to_py(out.hidden));
    }, py::arg("tokens"), py::arg("hidden"), py::arg("return_h") = false, py::arg("return_prob") = false)
    .def("init_hidden", [](const RNNModel& self, std::size_t batch){ return hidden_to_py(self.init_hidden(batch)); },
         py::arg("batch"))
    .def("init_weights", &RNNModel::init_weights)
    .def_property("mc_eval", &RNNModel::mc_eval, &RNNModel::set_mc_eval)
    .def_property_readonly("mode", &RNNModel::mode)
    .def_property_readonly("config", &RNNModel::config);
}
