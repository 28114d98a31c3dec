#pragma once

#include <exception>

#include "mprelude/callable.hpp"
#include "mprelude/caught_error.hpp"
#include "mprelude/either.hpp"

namespace mprelude {

// Placeholder for an unused ErrorKinds slot. Cannot be constructed, so it is
// never thrown and its handler never fires. Indexed so that each slot gets
// a distinct type.
template <int Slot>
class NoErrorKind : public std::exception {
 private:
  NoErrorKind();
};

/**
 * The exception classes WrapError turns into a Left, matched in the order
 * listed. Every kind must derive from std::exception.
 */
template <typename K1, typename K2 = NoErrorKind<2>,
          typename K3 = NoErrorKind<3>, typename K4 = NoErrorKind<4> >
struct ErrorKinds {};

/**
 * Run body and classify its outcome.
 *
 * A normal return becomes Right(value). An exception of one of the listed
 * kinds becomes Left(CaughtError). Any other exception propagates to the
 * caller untouched.
 *
 * Example:
 *   Either<CaughtError, double> r =
 *       WrapError(ErrorKinds<std::domain_error>(), ParseBody(text));
 */
template <typename K1, typename K2, typename K3, typename K4, typename F>
Either<CaughtError, typename CallableResult<F>::type> WrapError(
    ErrorKinds<K1, K2, K3, K4>, F body) {
  typedef Either<CaughtError, typename CallableResult<F>::type> Wrapped;
  RequireCallback(body, "WrapError");
  try {
    return Wrapped::Right(body());
  } catch (const K1& e) {
    return Wrapped::Left(CaughtError::Capture(e, 0));
  } catch (const K2& e) {
    return Wrapped::Left(CaughtError::Capture(e, 1));
  } catch (const K3& e) {
    return Wrapped::Left(CaughtError::Capture(e, 2));
  } catch (const K4& e) {
    return Wrapped::Left(CaughtError::Capture(e, 3));
  }
}

}  // namespace mprelude
