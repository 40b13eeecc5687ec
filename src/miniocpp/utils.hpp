#pragma once

/**
 * @defgroup miniocpp Mini OCPP
 */

/**
 * @defgroup miniocpp-utils Utilities
 * @ingroup miniocpp
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/file-system.hpp"
#include "utils/string-utils.hpp"
#include "utils/timestamp.hpp"
