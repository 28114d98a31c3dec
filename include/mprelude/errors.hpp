#pragma once

#include <stdexcept>
#include <string>

namespace mprelude {

/**
 * Thrown when a combinator is handed a null function pointer as its
 * callback. Raised on every variant, including the ones that would never
 * invoke the callback.
 */
class MissingCallback : public std::logic_error {
 public:
  explicit MissingCallback(const std::string& msg) : std::logic_error(msg) {}
};

/**
 * Thrown when unwrapping the channel a Maybe does not hold.
 */
class BadMaybeAccess : public std::runtime_error {
 public:
  explicit BadMaybeAccess(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Thrown when unwrapping the channel an Either does not hold and no
 * fallback was supplied.
 */
class BadEitherAccess : public std::runtime_error {
 public:
  explicit BadEitherAccess(const std::string& msg)
      : std::runtime_error(msg) {}
};

}  // namespace mprelude
