#include "mprelude/caught_error.hpp"

#include "mprelude/show.hpp"

namespace mprelude {

CaughtError::CaughtError(std::exception_ptr error, int kindIndex,
                         const std::string& message)
    : m_error(error), m_kindIndex(kindIndex), m_message(message) {}

int CaughtError::KindIndex() const { return m_kindIndex; }

const std::string& CaughtError::Message() const { return m_message; }

std::exception_ptr CaughtError::Exception() const { return m_error; }

void CaughtError::Rethrow() const { std::rethrow_exception(m_error); }

bool operator==(const CaughtError& a, const CaughtError& b) {
  return a.Exception() == b.Exception();
}

bool operator!=(const CaughtError& a, const CaughtError& b) {
  return !(a == b);
}

std::ostream& operator<<(std::ostream& out, const CaughtError& error) {
  out << "CaughtError(";
  WriteValue(out, error.Message());
  return out << ")";
}

}  // namespace mprelude
