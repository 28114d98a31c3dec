#pragma once

#include <new>
#include <ostream>

#include "mprelude/callable.hpp"
#include "mprelude/errors.hpp"
#include "mprelude/show.hpp"
#include "mprelude/storage.hpp"

namespace mprelude {

/**
 * Either<L, R> - a disjoint union holding exactly one of a Left (by
 * convention the failure) or a Right (the success).
 *
 * Storage is a discriminated union: one raw buffer sized for the larger of
 * L and R, a tag saying which one is alive, and placement new / explicit
 * destructor calls to manage it. The payload is never mutated after
 * construction.
 *
 * Combinators mirror each other across the two variants: Fmap and Bind act
 * on a Right and pass a Left through untouched, Lmap does the opposite.
 * Whichever variant short-circuits still insists on being handed a callback.
 */
template <typename L, typename R>
class Either {
 public:
  typedef L left_type;
  typedef R right_type;

  static Either Left(const L& value) { return Either(TagLeft(), value); }
  static Either Right(const R& value) { return Either(TagRight(), value); }

  Either(const Either& other) : m_isLeft(other.m_isLeft), m_has(false) {
    Construct(other);
  }

  // A failed copy puts the old value back before rethrowing. If putting it
  // back throws too, this Either holds nothing and may only be destroyed or
  // assigned to.
  Either& operator=(const Either& other) {
    if (this == &other) return *this;
    if (!m_has) {
      Construct(other);
    } else {
      Either saved(*this);
      Destroy();
      try {
        Construct(other);
      } catch (...) {
        Construct(saved);
        throw;
      }
    }
    return *this;
  }

  ~Either() { Destroy(); }

  bool IsLeft() const { return m_isLeft; }
  bool IsRight() const { return !m_isLeft; }

  /**
   * Pointer to the left value, or NULL for a Right.
   */
  const L* GetLeft() const { return m_isLeft ? m_store.First() : NULL; }

  /**
   * Pointer to the right value, or NULL for a Left.
   */
  const R* GetRight() const { return m_isLeft ? NULL : m_store.Second(); }

  /**
   * Functor map over the right channel. Right(v) becomes Right(f(v)); a
   * Left is carried over unchanged and f is not called. Callbacks here and
   * below are function pointers, function objects with a nested
   * result_type, or std::functions; a null pointer or an empty
   * std::function throws MissingCallback on either variant.
   */
  template <typename F>
  Either<L, typename CallableResult<F>::type> Fmap(F f) const {
    typedef Either<L, typename CallableResult<F>::type> Mapped;
    RequireCallback(f, "Either::Fmap");
    if (m_isLeft) return Mapped::Left(*m_store.First());
    return Mapped::Right(f(*m_store.Second()));
  }

  /**
   * Monadic bind over the right channel. f returns an Either<L, U> which is
   * returned as is; a Left short-circuits.
   */
  template <typename F>
  typename CallableResult<F>::type Bind(F f) const {
    typedef typename CallableResult<F>::type Bound;
    RequireCallback(f, "Either::Bind");
    if (m_isLeft) return Bound::Left(*m_store.First());
    return f(*m_store.Second());
  }

  /**
   * Map over the left channel. Left(e) becomes Left(f(e)); a Right is
   * carried over unchanged.
   */
  template <typename F>
  Either<typename CallableResult<F>::type, R> Lmap(F f) const {
    typedef Either<typename CallableResult<F>::type, R> Mapped;
    RequireCallback(f, "Either::Lmap");
    if (m_isLeft) return Mapped::Left(f(*m_store.First()));
    return Mapped::Right(*m_store.Second());
  }

  /**
   * Branch on the variant: onLeft(value) for a Left, onRight(value) for a
   * Right. Both callbacks must be present; only one is called.
   */
  template <typename FL, typename FR>
  typename CallableResult<FL>::type Match(FL onLeft, FR onRight) const {
    RequireCallback(onLeft, "Either::Match");
    RequireCallback(onRight, "Either::Match");
    if (m_isLeft) return onLeft(*m_store.First());
    return onRight(*m_store.Second());
  }

  /**
   * @throws BadEitherAccess on a Right
   */
  const L& FromLeft() const {
    if (!m_isLeft) {
      throw BadEitherAccess("Expected left value, got " + Show(*this));
    }
    return *m_store.First();
  }

  /**
   * Left value, or fallback(rightValue) on a Right. A null or empty
   * fallback counts as none and throws BadEitherAccess.
   */
  template <typename F>
  L FromLeft(F fallback) const {
    if (m_isLeft) return *m_store.First();
    if (!HasCallback(fallback)) {
      throw BadEitherAccess("Expected left value, got " + Show(*this));
    }
    return fallback(*m_store.Second());
  }

  /**
   * @throws BadEitherAccess on a Left
   */
  const R& FromRight() const {
    if (m_isLeft) {
      throw BadEitherAccess("Expected right value, got " + Show(*this));
    }
    return *m_store.Second();
  }

  /**
   * Right value, or fallback(leftValue) on a Left. A null or empty
   * fallback counts as none and throws BadEitherAccess.
   */
  template <typename F>
  R FromRight(F fallback) const {
    if (!m_isLeft) return *m_store.Second();
    if (!HasCallback(fallback)) {
      throw BadEitherAccess("Expected right value, got " + Show(*this));
    }
    return fallback(*m_store.First());
  }

 private:
  struct TagLeft {};
  struct TagRight {};

  Either(TagLeft, const L& value) : m_isLeft(true), m_has(false) {
    new (m_store.Ptr()) L(value);
    m_has = true;
  }
  Either(TagRight, const R& value) : m_isLeft(false), m_has(false) {
    new (m_store.Ptr()) R(value);
    m_has = true;
  }

  // Expects no live payload.
  void Construct(const Either& other) {
    m_isLeft = other.m_isLeft;
    if (m_isLeft) {
      new (m_store.Ptr()) L(*other.m_store.First());
    } else {
      new (m_store.Ptr()) R(*other.m_store.Second());
    }
    m_has = true;
  }

  void Destroy() {
    if (!m_has) return;
    m_has = false;
    if (m_isLeft) {
      m_store.First()->~L();
    } else {
      m_store.Second()->~R();
    }
  }

  bool m_isLeft;
  bool m_has;  // false only between Destroy and a failed Construct
  detail::DualStorage<L, R> m_store;
};

template <typename L, typename R>
bool operator==(const Either<L, R>& a, const Either<L, R>& b) {
  if (a.IsLeft() != b.IsLeft()) return false;
  if (a.IsLeft()) return *a.GetLeft() == *b.GetLeft();
  return *a.GetRight() == *b.GetRight();
}

template <typename L, typename R>
bool operator!=(const Either<L, R>& a, const Either<L, R>& b) {
  return !(a == b);
}

// Every Left orders before every Right.
template <typename L, typename R>
bool operator<(const Either<L, R>& a, const Either<L, R>& b) {
  if (a.IsLeft() != b.IsLeft()) return a.IsLeft();
  if (a.IsLeft()) return *a.GetLeft() < *b.GetLeft();
  return *a.GetRight() < *b.GetRight();
}

template <typename L, typename R>
std::ostream& operator<<(std::ostream& out, const Either<L, R>& either) {
  if (either.IsLeft()) {
    out << "Left(";
    WriteValue(out, *either.GetLeft());
  } else {
    out << "Right(";
    WriteValue(out, *either.GetRight());
  }
  return out << ")";
}

}  // namespace mprelude
