#pragma once
#include "mos/core/variables.hpp"

namespace mos {
// Returns a detached copy: same values/shape, no parents, requires_grad=false.
Variable stop_gradient(const Variable& x);

Variable detach(const Variable& x);

// Disables grad recording for Variables created in scope; restores the previous mode.
struct NoGradGuard {
  NoGradGuard();
  ~NoGradGuard();
  NoGradGuard(const NoGradGuard&) = delete;
  NoGradGuard& operator=(const NoGradGuard&) = delete;
private:
  bool prev_;
};
}
