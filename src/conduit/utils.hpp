
#pragma once

/**
 * @defgroup conduit Conduit
 */

/**
 * @defgroup conduit-utils Utilities
 * @ingroup conduit
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/string-utils.hpp"
