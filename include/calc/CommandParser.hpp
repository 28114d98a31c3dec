#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "calc/Command.hpp"
#include "mprelude/either.hpp"
#include "mprelude/maybe.hpp"

namespace calc {

class CommandParser {
 public:
  // Left: error message. Right(Nothing): blank or comment line.
  typedef mprelude::Either<std::string, mprelude::Maybe<Command> > LineResult;

  CommandParser();

  LineResult ParseLine(const std::string &line, size_t lineNo) const;

  // Appends one result per non-blank, non-comment line. A line holding a
  // NUL byte is a Left. Returns false if the file cannot be opened or read.
  bool ParseFile(const char *path, std::vector<LineResult> &out) const;

  // Operand count a command takes, or Nothing for an unknown command.
  static mprelude::Maybe<size_t> Arity(const std::string &name);

 private:
  static std::vector<std::string> Tokenize(const std::string &line);
};

}  // namespace calc
