#pragma once

#include <new>
#include <ostream>

#include "mprelude/callable.hpp"
#include "mprelude/errors.hpp"
#include "mprelude/show.hpp"
#include "mprelude/storage.hpp"

namespace mprelude {

/**
 * Maybe<T> - a value that is either present (Just) or absent (Nothing).
 *
 * The payload lives in raw aligned storage inside the object and is built
 * with placement new, so there is no heap allocation and no null sentinel.
 * A Maybe never changes its payload after construction: there are no
 * setters and every accessor hands out const references. Assignment
 * replaces the whole value.
 *
 * Nothing carries no state, so any two Nothing values of the same type are
 * interchangeable and compare equal.
 */
template <typename T>
class Maybe {
 public:
  typedef T value_type;

  /**
   * The absent value.
   */
  static Maybe Nothing() { return Maybe(); }

  /**
   * Wrap a value. The value is copied; it is not cloned deeply.
   */
  static Maybe Just(const T& value) { return Maybe(value); }

  Maybe(const Maybe& other) : m_has(false) { CopyFrom(other); }

  Maybe& operator=(const Maybe& other) {
    if (this != &other) {
      Destroy();
      CopyFrom(other);
    }
    return *this;
  }

  ~Maybe() { Destroy(); }

  bool IsJust() const { return m_has; }
  bool IsNothing() const { return !m_has; }

  /**
   * Pointer to the held value, or NULL for Nothing.
   */
  const T* Get() const { return m_has ? m_store.Obj() : NULL; }

  /**
   * Extract the held value.
   * @throws BadMaybeAccess if this is Nothing
   */
  const T& FromJust() const {
    if (!m_has) {
      throw BadMaybeAccess("Expected just value, got Nothing");
    }
    return *m_store.Obj();
  }

  /**
   * Extract the held value or return the given default.
   */
  T FromMaybe(const T& defaultValue) const {
    return m_has ? *m_store.Obj() : defaultValue;
  }

  /**
   * Functor map. Just(v) becomes Just(f(v)) with f called exactly once;
   * Nothing stays Nothing and f is never called. f is a function pointer,
   * a function object with a nested result_type, or a std::function (the
   * way to pass a lambda).
   * @throws MissingCallback if f is a null function pointer or an empty
   *         std::function, on both variants
   */
  template <typename F>
  Maybe<typename CallableResult<F>::type> Fmap(F f) const {
    typedef Maybe<typename CallableResult<F>::type> Mapped;
    RequireCallback(f, "Maybe::Fmap");
    if (!m_has) return Mapped::Nothing();
    return Mapped::Just(f(*m_store.Obj()));
  }

  /**
   * Monadic bind. f already returns a Maybe, which is returned as is for
   * Just(v). Nothing short-circuits without calling f.
   * @throws MissingCallback if f is a null function pointer or an empty
   *         std::function, on both variants
   */
  template <typename F>
  typename CallableResult<F>::type Bind(F f) const {
    typedef typename CallableResult<F>::type Bound;
    RequireCallback(f, "Maybe::Bind");
    if (!m_has) return Bound::Nothing();
    return f(*m_store.Obj());
  }

  /**
   * Exhaustive match: onNothing() for Nothing, onJust(value) for Just.
   * Exactly one of the two is called, once.
   */
  template <typename FN, typename FJ>
  typename CallableResult<FJ>::type Match(FN onNothing, FJ onJust) const {
    RequireCallback(onNothing, "Maybe::Match");
    RequireCallback(onJust, "Maybe::Match");
    if (!m_has) return onNothing();
    return onJust(*m_store.Obj());
  }

 private:
  Maybe() : m_has(false) {}
  explicit Maybe(const T& value) : m_has(false) {
    new (m_store.Ptr()) T(value);
    m_has = true;
  }

  void CopyFrom(const Maybe& other) {
    if (other.m_has) {
      new (m_store.Ptr()) T(*other.m_store.Obj());
      m_has = true;
    }
  }

  void Destroy() {
    if (m_has) {
      m_store.Obj()->~T();
      m_has = false;
    }
  }

  bool m_has;
  detail::RawStorage<T> m_store;
};

template <typename T>
bool operator==(const Maybe<T>& a, const Maybe<T>& b) {
  if (a.IsNothing() || b.IsNothing()) return a.IsNothing() == b.IsNothing();
  return *a.Get() == *b.Get();
}

template <typename T>
bool operator!=(const Maybe<T>& a, const Maybe<T>& b) {
  return !(a == b);
}

// Nothing orders before every Just.
template <typename T>
bool operator<(const Maybe<T>& a, const Maybe<T>& b) {
  if (b.IsNothing()) return false;
  if (a.IsNothing()) return true;
  return *a.Get() < *b.Get();
}

template <typename T>
std::ostream& operator<<(std::ostream& out, const Maybe<T>& maybe) {
  if (maybe.IsNothing()) return out << "Nothing";
  out << "Just(";
  WriteValue(out, *maybe.Get());
  return out << ")";
}

}  // namespace mprelude
