
#pragma once

// Included first by every translation unit in the library and the testcases.

#include "conduit/utils/base-include.hpp"
#include "conduit/utils/error-codes.hpp"
