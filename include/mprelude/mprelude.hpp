// Umbrella header.
#pragma once

#include "mprelude.h"
#include "mprelude/caught_error.hpp"
#include "mprelude/either.hpp"
#include "mprelude/errors.hpp"
#include "mprelude/maybe.hpp"
#include "mprelude/wrap_error.hpp"
