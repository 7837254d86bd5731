#pragma once

#include <stdexcept>
#include <string>

namespace draft_bandit {

// Bad pool, strategy or run parameters.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// A player, arm or round index past the end of its collection.
class IndexOutOfRange : public std::out_of_range {
public:
  explicit IndexOutOfRange(const std::string &what)
      : std::out_of_range(what) {}
};

// A roster update that would break the role caps or a strict budget.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(const std::string &what)
      : std::logic_error(what) {}
};

} // namespace draft_bandit
