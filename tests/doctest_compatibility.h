#ifndef DOCTEST_COMPATIBILITY_H
#define DOCTEST_COMPATIBILITY_H

#include <doctest/doctest.h>

// Catch-style section names used across the test suites
#define SECTION(name) DOCTEST_SUBCASE(name)

#endif  // DOCTEST_COMPATIBILITY_H
