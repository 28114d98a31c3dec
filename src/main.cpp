// Entry point: read a batch file of calculator commands and evaluate each
// line, reporting failures without stopping the batch.

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "calc/Command.hpp"
#include "calc/CommandParser.hpp"
#include "calc/Evaluator.hpp"
#include "mprelude/mprelude.hpp"

using mprelude::CaughtError;

static std::string defaultBatchPath() {
  return "conf/calc.batch";  // relative to working directory
}

namespace {

struct PrintValue {
  typedef bool result_type;
  explicit PrintValue(size_t line) : m_line(line) {}
  bool operator()(double value) const {
    std::cout << "line " << m_line << ": " << value << "\n";
    return true;
  }
  size_t m_line;
};

struct ReportEvalError {
  typedef bool result_type;
  explicit ReportEvalError(size_t line) : m_line(line) {}
  bool operator()(const CaughtError &error) const {
    std::cerr << "[eval] line " << m_line << ": " << error.Message() << "\n";
    return false;
  }
  size_t m_line;
};

}  // namespace

int main(int argc, char **argv) {
  std::string path = defaultBatchPath();
  if (argc > 1) {
    if (std::strcmp(argv[1], "--version") == 0) {
      std::cout << "mprelude-calc " << MPRELUDE_VERSION_STRING << "\n";
      return 0;
    }
    path = argv[1];
  }

  calc::CommandParser parser;
  std::vector<calc::CommandParser::LineResult> lines;
  if (!parser.ParseFile(path.c_str(), lines)) {
    std::cerr << "[open] failed to read batch file: " << path << "\n";
    return 1;
  }

  size_t failures = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    const calc::CommandParser::LineResult &parsed = lines[i];
    if (parsed.IsLeft()) {
      std::cerr << "[parse] " << parsed.FromLeft() << "\n";
      ++failures;
      continue;
    }
    const calc::Command &cmd = parsed.FromRight().FromJust();
    bool ok = calc::Evaluate(cmd).Match(ReportEvalError(cmd.line),
                                        PrintValue(cmd.line));
    if (!ok) ++failures;
  }

  if (failures) {
    std::cerr << "[done] " << failures << " of " << lines.size()
              << " line(s) failed\n";
    return 2;
  }
  return 0;
}
