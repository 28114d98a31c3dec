// Library version. Bumped by hand on release.
#pragma once

#define MPRELUDE_VERSION_MAJOR 0
#define MPRELUDE_VERSION_MINOR 1
#define MPRELUDE_VERSION_PATCH 0
#define MPRELUDE_VERSION_STRING "0.1.0"
