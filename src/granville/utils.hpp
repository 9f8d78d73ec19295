
#pragma once

/**
 * @defgroup granville Granville
 */

/**
 * @defgroup granville-utils Utilities
 * @ingroup granville
 */

#include "utils/base-include.hpp"

#include "utils/cli-utils.hpp"
#include "utils/error-codes.hpp"
#include "utils/guid.hpp"
