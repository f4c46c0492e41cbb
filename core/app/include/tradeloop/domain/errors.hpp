#pragma once

#include <stdexcept>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// Error types
// -----------------------------------------------------------------------------
//
// Two families:
//
//   std::logic_error  → programming bugs. The agent logs CRITICAL, halts, and
//                       rethrows. Never used for expected control flow.
//     - IllegalTransitionError: (state, trigger) pair not in the table.
//     - InvariantViolation:     a capital-safety invariant would break
//                               (second Held reservation for a pair,
//                               execution without an approved verdict, ...).
//
//   std::runtime_error → environment problems.
//     - ConfigError:       bad or unreadable configuration, thrown at load.
//     - CollaboratorError: convenience type for port implementations that
//                          need to report a failed external call.
// -----------------------------------------------------------------------------
class IllegalTransitionError : public std::logic_error {
 public:
  explicit IllegalTransitionError(const std::string& what)
      : std::logic_error(what) {}
};

class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class CollaboratorError : public std::runtime_error {
 public:
  explicit CollaboratorError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace tradeloop
