#pragma once

#include <ostream>
#include <sstream>
#include <string>

namespace mprelude {

// Payload rendering used by the operator<< of Maybe and Either.
template <typename T>
void WriteValue(std::ostream& out, const T& value) {
  out << value;
}

inline void WriteValue(std::ostream& out, const std::string& value) {
  out << '"' << value << '"';
}

inline void WriteValue(std::ostream& out, const char* value) {
  out << '"' << value << '"';
}

template <typename T>
std::string Show(const T& value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

}  // namespace mprelude
