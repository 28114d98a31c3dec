#pragma once

#include <string>

#include "calc/Command.hpp"
#include "mprelude/caught_error.hpp"
#include "mprelude/either.hpp"

namespace calc {

/**
 * Parse a numeric operand.
 * @throws std::invalid_argument if text is not a complete number
 * @throws std::out_of_range if it does not fit in a double
 */
double ParseOperand(const std::string &text);

/**
 * Run one command. Bad operands, division by zero, square roots of
 * negatives and non-finite results come back as a Left.
 */
mprelude::Either<mprelude::CaughtError, double> Evaluate(const Command &cmd);

}  // namespace calc
