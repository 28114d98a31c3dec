// Compile-time helpers for the callbacks handed to the combinators.
//
// C++98 function objects have no deducible return type, so callers either
// publish a nested result_type (as std::unary_function did) or pass a plain
// function pointer, which the specializations below pick apart. A lambda
// publishes no result_type: wrap it in a std::function of the right
// signature first.

#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "mprelude/errors.hpp"

namespace mprelude {

template <typename F>
struct CallableResult {
  typedef typename F::result_type type;
};

template <typename R>
struct CallableResult<R (*)()> {
  typedef R type;
};

template <typename R, typename A>
struct CallableResult<R (*)(A)> {
  typedef R type;
};

// A function object is always present unless a specialization below says
// otherwise.
template <typename F>
struct CallbackPresence {
  static bool IsPresent(const F&) { return true; }
};

template <typename R>
struct CallbackPresence<R (*)()> {
  static bool IsPresent(R (*f)()) { return f != NULL; }
};

template <typename R, typename A>
struct CallbackPresence<R (*)(A)> {
  static bool IsPresent(R (*f)(A)) { return f != NULL; }
};

// An empty std::function is as missing as a null pointer.
template <typename Sig>
struct CallbackPresence<std::function<Sig> > {
  static bool IsPresent(const std::function<Sig>& f) {
    return static_cast<bool>(f);
  }
};

template <typename F>
bool HasCallback(const F& f) {
  return CallbackPresence<F>::IsPresent(f);
}

/**
 * Throws MissingCallback unless f can be called.
 * @param operation name used in the exception message, e.g. "Maybe::Fmap"
 */
template <typename F>
void RequireCallback(const F& f, const char* operation) {
  if (!HasCallback(f)) {
    throw MissingCallback(std::string(operation) + ": missing callback");
  }
}

}  // namespace mprelude
