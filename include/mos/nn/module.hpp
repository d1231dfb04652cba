// ============================
// File: include/mos/nn/module.hpp
// ============================
#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <memory>

#include "mos/core/variables.hpp"

namespace mos::nn {

// Base class for neural-network modules.
// - Parameter registration + recursive collection
// - Named children/params (for checkpoints, debugging)
// - train()/eval() with a protected on_mode_change() hook
// - zero_grad()
//
// Forward signatures differ per module (token batches, recurrent state,
// execution mode), so the base class does not declare one.
//
// Notes:
// * Copy/move are deleted to avoid dangling Module*/Variable* registrations.
// * Derived classes implement _parameters() to return ONLY their own params.
// * Parameters are deduplicated by storage: two Variables sharing one Node
//   (tied weights) are reported once, under the first name reached.
class Module {
public:
  Module() = default;
  virtual ~Module() = default;

  Module(const Module&)            = delete;
  Module& operator=(const Module&) = delete;
  Module(Module&&)                 = delete;
  Module& operator=(Module&&)      = delete;

  // Parameter utilities
  std::vector<Variable*> parameters();
  std::vector<std::pair<std::string, Variable*>> named_parameters(const std::string& prefix = "");
  // Full dotted name (as produced by named_parameters()); nullptr if absent.
  Variable* find_parameter(const std::string& name);
  // Total scalar count over unique parameter storage.
  std::size_t num_parameters();
  void zero_grad();

  // Mode control
  void train();
  void eval();
  bool training() const;

  // Hierarchy (children)
  // register a non-owning (member) child
  Module& register_module(const std::string& name, Module& m);
  // register an owning child (preferred for heap-held children)
  std::shared_ptr<Module> register_module(const std::string& name, std::shared_ptr<Module> m);

  // Parameter registration (for naming/checkpointing)
  Module& register_parameter(const std::string& name, Variable& v);

protected:
  // Derived classes can override this to react to mode changes.
  virtual void on_mode_change() {}

  // Derived classes MUST implement this to return pointers to their own params only.
  virtual std::vector<Variable*> _parameters() = 0;

private:
  // raw (unfiltered, may contain tied duplicates) named walk
  void collect_named_(const std::string& prefix,
                      std::vector<std::pair<std::string, Variable*>>& out);

  bool is_training_ = true;

  // Children for recursion, in registration order
  std::vector<std::pair<std::string, Module*>> named_children_;
  std::vector<std::shared_ptr<Module>> owned_children_;

  // Explicitly named parameters local to *this* module
  std::vector<std::pair<std::string, Variable*>> named_params_;
};

} // namespace mos::nn
