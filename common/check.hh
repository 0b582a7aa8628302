
#pragma once

#include "assert/assert.hpp"

#define KAMI_CHECK(expr, ...) \
    ASSERT_INVOKE(expr, false, true, "KAMI_CHECK", verification, , __VA_ARGS__)

namespace kami {
using check_failure = libassert::verification_failure;
}
