#include "calc/Evaluator.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "mprelude/wrap_error.hpp"

using mprelude::CaughtError;
using mprelude::Either;
using mprelude::ErrorKinds;

namespace calc {

namespace {

double checked(double value) {
  if (!std::isfinite(value))
    throw std::out_of_range("result out of range");
  return value;
}

struct EvaluateBody {
  typedef double result_type;
  explicit EvaluateBody(const Command &cmd) : m_cmd(cmd) {}

  double operator()() const {
    std::vector<double> args;
    for (size_t i = 0; i < m_cmd.operands.size(); ++i)
      args.push_back(ParseOperand(m_cmd.operands[i]));

    if (m_cmd.name == "sqrt") {
      Expect(args, 1);
      if (args[0] < 0) throw std::domain_error("square root of negative number");
      return std::sqrt(args[0]);
    }
    Expect(args, 2);
    if (m_cmd.name == "add") return checked(args[0] + args[1]);
    if (m_cmd.name == "sub") return checked(args[0] - args[1]);
    if (m_cmd.name == "mul") return checked(args[0] * args[1]);
    if (m_cmd.name == "div") {
      if (args[1] == 0) throw std::domain_error("division by zero");
      return checked(args[0] / args[1]);
    }
    throw std::invalid_argument("unknown command '" + m_cmd.name + "'");
  }

 private:
  void Expect(const std::vector<double> &args, size_t count) const {
    if (args.size() != count)
      throw std::invalid_argument("wrong operand count for '" + m_cmd.name +
                                  "'");
  }

  const Command &m_cmd;
};

}  // namespace

double ParseOperand(const std::string &text) {
  if (text.empty()) throw std::invalid_argument("empty operand");
  const char *begin = text.c_str();
  char *end = 0;
  errno = 0;
  double value = std::strtod(begin, &end);
  if (end != begin + text.size())
    throw std::invalid_argument("not a number: '" + text + "'");
  if (errno == ERANGE && (value == HUGE_VAL || value == -HUGE_VAL))
    throw std::out_of_range("operand out of range: '" + text + "'");
  if (value != value) throw std::invalid_argument("not a number: '" + text + "'");
  if (!std::isfinite(value))
    throw std::out_of_range("operand out of range: '" + text + "'");
  return value;
}

Either<CaughtError, double> Evaluate(const Command &cmd) {
  return mprelude::WrapError(
      ErrorKinds<std::domain_error, std::invalid_argument, std::out_of_range>(),
      EvaluateBody(cmd));
}

}  // namespace calc
