#include "calc/CommandParser.hpp"

#include <cstdio>
#include <sstream>

using mprelude::Maybe;

namespace calc {

namespace {

std::string describeArityError(const Command &cmd, size_t expected) {
  std::ostringstream msg;
  msg << "line " << cmd.line << ": '" << cmd.name << "' expects " << expected
      << (expected == 1 ? " operand" : " operands") << ", got "
      << cmd.operands.size();
  return msg.str();
}

// Blank and comment lines parse to Right(Nothing) and are dropped.
void keepLine(const CommandParser::LineResult &result,
              std::vector<CommandParser::LineResult> &out) {
  if (result.IsLeft() || result.GetRight()->IsJust()) out.push_back(result);
}

}  // namespace

CommandParser::CommandParser() {}

Maybe<size_t> CommandParser::Arity(const std::string &name) {
  if (name == "add" || name == "sub" || name == "mul" || name == "div")
    return Maybe<size_t>::Just(2);
  if (name == "sqrt") return Maybe<size_t>::Just(1);
  return Maybe<size_t>::Nothing();
}

std::vector<std::string> CommandParser::Tokenize(const std::string &line) {
  std::vector<std::string> tokens;
  std::string::size_type start = 0;
  while (start < line.size()) {
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t' ||
                                   line[start] == '\r' || line[start] == '\n'))
      ++start;
    if (start >= line.size()) break;
    std::string::size_type end = start;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t' &&
           line[end] != '\r' && line[end] != '\n')
      ++end;
    tokens.push_back(line.substr(start, end - start));
    start = end;
  }
  return tokens;
}

CommandParser::LineResult CommandParser::ParseLine(const std::string &line,
                                                   size_t lineNo) const {
  if (line.find('\0') != std::string::npos) {
    std::ostringstream msg;
    msg << "line " << lineNo << ": unexpected NUL byte";
    return LineResult::Left(msg.str());
  }
  std::vector<std::string> tokens = Tokenize(line);
  if (tokens.empty() || tokens[0][0] == '#')
    return LineResult::Right(Maybe<Command>::Nothing());

  Command cmd;
  cmd.name = tokens[0];
  cmd.operands.assign(tokens.begin() + 1, tokens.end());
  cmd.line = lineNo;

  Maybe<size_t> arity = Arity(cmd.name);
  if (arity.IsNothing()) {
    std::ostringstream msg;
    msg << "line " << lineNo << ": unknown command '" << cmd.name << "'";
    return LineResult::Left(msg.str());
  }
  if (cmd.operands.size() != arity.FromJust())
    return LineResult::Left(describeArityError(cmd, arity.FromJust()));
  return LineResult::Right(Maybe<Command>::Just(cmd));
}

bool CommandParser::ParseFile(const char *path,
                              std::vector<LineResult> &out) const {
  FILE *f = std::fopen(path, "r");
  if (!f) {
    std::perror("open batch");
    return false;
  }
  std::string pending;
  size_t lineNo = 0;
  int c;
  while ((c = std::fgetc(f)) != EOF) {
    pending += static_cast<char>(c);
    if (c != '\n') continue;
    ++lineNo;
    keepLine(ParseLine(pending, lineNo), out);
    pending.clear();
  }
  if (!pending.empty()) keepLine(ParseLine(pending, ++lineNo), out);
  bool readOk = !std::ferror(f);
  if (!readOk) std::perror("read batch");
  std::fclose(f);
  return readOk;
}

}  // namespace calc
