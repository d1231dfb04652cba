#ifndef MOS_CORE_ERRORS_HPP
#define MOS_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mos {

// Invalid construction arguments: unknown weight name, incompatible tying,
// non-positive sizes, dropout probabilities outside [0, 1).
struct ConfigurationError : std::invalid_argument {
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Forward-call inputs whose dimensions disagree with the configured sizes.
// Raised before any computation starts.
struct ShapeError : std::invalid_argument {
  explicit ShapeError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace mos

#endif // MOS_CORE_ERRORS_HPP
