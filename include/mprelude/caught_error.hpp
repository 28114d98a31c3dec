#pragma once

#include <exception>
#include <ostream>
#include <string>

namespace mprelude {

/**
 * An exception captured by WrapError and carried as a Left value.
 *
 * The original exception object is kept alive, so it can be tested for its
 * dynamic kind or thrown again. Copies share the same exception object;
 * two CaughtErrors compare equal when they hold the same object.
 */
class CaughtError {
 public:
  /**
   * Build from inside a catch handler. K must derive from std::exception.
   * This is the only way to make a CaughtError, so one always holds a live
   * exception.
   */
  template <typename K>
  static CaughtError Capture(const K& error, int kindIndex) {
    const std::exception& base = error;
    return CaughtError(std::current_exception(), kindIndex, base.what());
  }

  /**
   * Zero-based position, in the ErrorKinds list, of the first kind that
   * matched.
   */
  int KindIndex() const;

  // what() of the caught exception.
  const std::string& Message() const;

  std::exception_ptr Exception() const;

  /**
   * True when the caught exception is a K (or derives from it).
   */
  template <typename K>
  bool Is() const {
    try {
      std::rethrow_exception(m_error);
    } catch (const K&) {
      return true;
    } catch (const std::exception&) {
      return false;
    }
    return false;
  }

  void Rethrow() const;

 private:
  CaughtError(std::exception_ptr error, int kindIndex,
              const std::string& message);

  std::exception_ptr m_error;
  int m_kindIndex;
  std::string m_message;
};

bool operator==(const CaughtError& a, const CaughtError& b);
bool operator!=(const CaughtError& a, const CaughtError& b);
std::ostream& operator<<(std::ostream& out, const CaughtError& error);

}  // namespace mprelude
