// ============================
// File: src/mos/nn/module.cpp
// ============================
#include "mos/nn/module.hpp"
#include <stdexcept>
#include <unordered_set>

namespace mos::nn {

static std::string join_name(const std::string& prefix, const std::string& name) {
  if (prefix.empty()) return name;
  if (name.empty()) return prefix;
  return prefix + "." + name;
}

void Module::collect_named_(const std::string& prefix,
                            std::vector<std::pair<std::string, Variable*>>& out) {
  // Local: explicitly named params first, then anything _parameters() adds
  for (auto& [name, p] : named_params_) if (p) out.emplace_back(join_name(prefix, name), p);
  std::size_t anon = 0;
  for (auto* p : _parameters()) {
    if (!p) continue;
    bool named = false;
    for (auto& kv : named_params_) if (kv.second == p) { named = true; break; }
    if (!named) out.emplace_back(join_name(prefix, "param" + std::to_string(anon++)), p);
  }

  for (auto& [cname, child] : named_children_) {
    if (child) child->collect_named_(join_name(prefix, cname), out);
  }
}

std::vector<std::pair<std::string, Variable*>> Module::named_parameters(const std::string& prefix) {
  std::vector<std::pair<std::string, Variable*>> raw;
  collect_named_(prefix, raw);

  // Order-preserving dedup by storage
  std::vector<std::pair<std::string, Variable*>> out;
  out.reserve(raw.size());
  std::unordered_set<const Node*> seen;
  for (auto& kv : raw) {
    if (seen.insert(kv.second->n.get()).second) out.push_back(std::move(kv));
  }
  return out;
}

std::vector<Variable*> Module::parameters() {
  std::vector<Variable*> out;
  for (auto& kv : named_parameters()) out.push_back(kv.second);
  return out;
}

Variable* Module::find_parameter(const std::string& name) {
  std::vector<std::pair<std::string, Variable*>> raw;
  collect_named_("", raw);
  for (auto& kv : raw) if (kv.first == name) return kv.second;
  return nullptr;
}

std::size_t Module::num_parameters() {
  std::size_t total = 0;
  for (auto* p : parameters()) total += p->numel();
  return total;
}

void Module::zero_grad() {
  for (auto* p : parameters()) {
    if (p) p->zero_grad();
  }
}

void Module::train() {
  is_training_ = true;
  on_mode_change();
  for (auto& kv : named_children_) if (kv.second) kv.second->train();
}

void Module::eval() {
  is_training_ = false;
  on_mode_change();
  for (auto& kv : named_children_) if (kv.second) kv.second->eval();
}

bool Module::training() const { return is_training_; }

Module& Module::register_module(const std::string& name, Module& m) {
  named_children_.push_back({name, &m});
  return m;
}

std::shared_ptr<Module> Module::register_module(const std::string& name, std::shared_ptr<Module> m) {
  if (!m) throw std::invalid_argument("register_module: null module '" + name + "'");
  named_children_.push_back({name, m.get()});
  owned_children_.push_back(m);
  return m;
}

Module& Module::register_parameter(const std::string& name, Variable& v) {
  named_params_.push_back({name, &v});
  return *this;
}

} // namespace mos::nn
