// Unit tests for the batch calculator parser and evaluator
#include <criterion/criterion.h>

#include <unistd.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "calc/CommandParser.hpp"
#include "calc/Evaluator.hpp"

using calc::Command;
using calc::CommandParser;
using mprelude::CaughtError;
using mprelude::Either;

namespace {

Command makeCommand(const char *name, const char *a, const char *b) {
  Command cmd;
  cmd.name = name;
  cmd.operands.push_back(a);
  if (b) cmd.operands.push_back(b);
  cmd.line = 1;
  return cmd;
}

// Writes contents to a fresh temporary file and returns its path.
std::string writeTempFile(const std::string &contents) {
  char path[] = "/tmp/mprelude_calc_XXXXXX";
  int fd = ::mkstemp(path);
  cr_assert(fd >= 0);
  ssize_t written = ::write(fd, contents.data(), contents.size());
  cr_assert_eq(written, (ssize_t)contents.size());
  ::close(fd);
  return path;
}

}  // namespace

Test(CommandParser, blank_and_comment_lines_are_nothing) {
  CommandParser p;
  CommandParser::LineResult blank = p.ParseLine("   \t\r\n", 1);
  CommandParser::LineResult comment = p.ParseLine("# add 1 2\n", 2);
  cr_assert(blank.IsRight());
  cr_assert(blank.FromRight().IsNothing());
  cr_assert(comment.IsRight());
  cr_assert(comment.FromRight().IsNothing());
}

Test(CommandParser, parses_command_with_operands) {
  CommandParser p;
  CommandParser::LineResult r = p.ParseLine("  div\t10  4\r\n", 7);
  cr_assert(r.IsRight());
  const Command &cmd = r.FromRight().FromJust();
  cr_assert(cmd.name == "div");
  cr_assert_eq(cmd.operands.size(), 2u);
  cr_assert(cmd.operands[0] == "10");
  cr_assert(cmd.operands[1] == "4");
  cr_assert_eq(cmd.line, 7u);
}

Test(CommandParser, rejects_unknown_command) {
  CommandParser p;
  CommandParser::LineResult r = p.ParseLine("pow 2 8", 3);
  cr_assert(r.IsLeft());
  cr_assert(r.FromLeft() == "line 3: unknown command 'pow'");
}

Test(CommandParser, rejects_wrong_operand_count) {
  CommandParser p;
  cr_assert(p.ParseLine("sqrt 1 2", 4).FromLeft() ==
            "line 4: 'sqrt' expects 1 operand, got 2");
  cr_assert(p.ParseLine("add 1", 5).FromLeft() ==
            "line 5: 'add' expects 2 operands, got 1");
}

Test(CommandParser, arity_table) {
  cr_assert(CommandParser::Arity("mul").FromMaybe(0) == 2);
  cr_assert(CommandParser::Arity("sqrt").FromMaybe(0) == 1);
  cr_assert(CommandParser::Arity("ADD").IsNothing());
}

Test(CommandParser, parse_file_skips_blank_lines) {
  std::string path =
      writeTempFile("# header\n\nadd 1 2\nbogus\n\nsqrt 9");  // no final EOL
  CommandParser p;
  std::vector<CommandParser::LineResult> lines;
  cr_assert(p.ParseFile(path.c_str(), lines));
  ::unlink(path.c_str());

  cr_assert_eq(lines.size(), 3u);
  cr_assert(lines[0].FromRight().FromJust().name == "add");
  cr_assert_eq(lines[0].FromRight().FromJust().line, 3u);
  cr_assert(lines[1].FromLeft() == "line 4: unknown command 'bogus'");
  cr_assert(lines[2].FromRight().FromJust().name == "sqrt");
  cr_assert_eq(lines[2].FromRight().FromJust().line, 6u);
}

Test(CommandParser, nul_byte_in_line_is_an_error) {
  CommandParser p;
  CommandParser::LineResult r = p.ParseLine(std::string("add 1\0 2", 8), 9);
  cr_assert(r.IsLeft());
  cr_assert(r.FromLeft() == "line 9: unexpected NUL byte");
}

Test(CommandParser, parse_file_survives_nul_bytes) {
  const char contents[] = "add 1 2\n\0junk\nsqrt 9\n";
  std::string path =
      writeTempFile(std::string(contents, sizeof(contents) - 1));
  CommandParser p;
  std::vector<CommandParser::LineResult> lines;
  cr_assert(p.ParseFile(path.c_str(), lines));
  ::unlink(path.c_str());

  cr_assert_eq(lines.size(), 3u);
  cr_assert(lines[0].FromRight().FromJust().name == "add");
  cr_assert(lines[1].FromLeft() == "line 2: unexpected NUL byte");
  cr_assert(lines[2].FromRight().FromJust().name == "sqrt");
  cr_assert_eq(lines[2].FromRight().FromJust().line, 3u);
}

Test(CommandParser, parse_file_with_only_nul_byte) {
  std::string path = writeTempFile(std::string(1, '\0'));
  CommandParser p;
  std::vector<CommandParser::LineResult> lines;
  cr_assert(p.ParseFile(path.c_str(), lines));
  ::unlink(path.c_str());

  cr_assert_eq(lines.size(), 1u);
  cr_assert(lines[0].FromLeft() == "line 1: unexpected NUL byte");
}

Test(CommandParser, parse_file_reports_missing_file) {
  CommandParser p;
  std::vector<CommandParser::LineResult> lines;
  cr_assert(!p.ParseFile("/nonexistent/mprelude/calc.batch", lines));
  cr_assert(lines.empty());
}

Test(Evaluator, parse_operand) {
  cr_assert(calc::ParseOperand("2.5") == 2.5);
  cr_assert(calc::ParseOperand("-4") == -4.0);
  cr_assert_throw(calc::ParseOperand("one"), std::invalid_argument);
  cr_assert_throw(calc::ParseOperand("1x"), std::invalid_argument);
  cr_assert_throw(calc::ParseOperand(""), std::invalid_argument);
  cr_assert_throw(calc::ParseOperand("1e999"), std::out_of_range);
}

Test(Evaluator, arithmetic) {
  cr_assert(calc::Evaluate(makeCommand("add", "1", "2")).FromRight() == 3.0);
  cr_assert(calc::Evaluate(makeCommand("sub", "1", "2")).FromRight() == -1.0);
  cr_assert(calc::Evaluate(makeCommand("mul", "2.5", "4")).FromRight() ==
            10.0);
  cr_assert(calc::Evaluate(makeCommand("div", "10", "4")).FromRight() == 2.5);
  cr_assert(calc::Evaluate(makeCommand("sqrt", "81", NULL)).FromRight() ==
            9.0);
}

Test(Evaluator, domain_errors_become_left) {
  Either<CaughtError, double> byZero =
      calc::Evaluate(makeCommand("div", "1", "0"));
  cr_assert(byZero.IsLeft());
  cr_assert(byZero.FromLeft().Is<std::domain_error>());
  cr_assert(byZero.FromLeft().Message() == "division by zero");

  Either<CaughtError, double> negRoot =
      calc::Evaluate(makeCommand("sqrt", "-4", NULL));
  cr_assert(negRoot.IsLeft());
  cr_assert_eq(negRoot.FromLeft().KindIndex(), 0);
}

Test(Evaluator, bad_operands_become_left) {
  Either<CaughtError, double> r = calc::Evaluate(makeCommand("add", "one", "2"));
  cr_assert(r.IsLeft());
  cr_assert_eq(r.FromLeft().KindIndex(), 1);
  cr_assert(r.FromLeft().Message() == "not a number: 'one'");

  Either<CaughtError, double> arity = calc::Evaluate(makeCommand("add", "1", NULL));
  cr_assert(arity.IsLeft());
  cr_assert(arity.FromLeft().Is<std::invalid_argument>());
}

Test(Evaluator, overflow_becomes_left) {
  Either<CaughtError, double> r =
      calc::Evaluate(makeCommand("mul", "1e300", "1e300"));
  cr_assert(r.IsLeft());
  cr_assert_eq(r.FromLeft().KindIndex(), 2);
  cr_assert(r.FromLeft().Is<std::out_of_range>());
}
