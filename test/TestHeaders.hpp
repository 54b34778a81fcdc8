#ifndef __AGT_TEST_HEADERS__
#define __AGT_TEST_HEADERS__

#include <catch2/catch_test_macros.hpp>

#include "Headers.hpp"

#endif  // __AGT_TEST_HEADERS__
