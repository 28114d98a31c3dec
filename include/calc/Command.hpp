// Batch calculator command (C++98 POD-style)
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace calc {

struct Command {
  std::string name;                   // add, sub, mul, div, sqrt
  std::vector<std::string> operands;  // raw operand tokens
  size_t line;                        // 1-based source line
  Command() : line(0) {}
};

inline bool operator==(const Command &a, const Command &b) {
  return a.name == b.name && a.operands == b.operands && a.line == b.line;
}

inline std::ostream &operator<<(std::ostream &out, const Command &cmd) {
  out << cmd.name;
  for (size_t i = 0; i < cmd.operands.size(); ++i) out << ' ' << cmd.operands[i];
  return out;
}

}  // namespace calc
