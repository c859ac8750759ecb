#pragma once

#include <cstdint>

/**
 * @brief Compile-time flags.
 *
 * These values must be constexpr because they are used
 * with if constexpr for conditional compilation (logging).
 */
namespace Flags {

    namespace Logging {
        constexpr bool IS_DEBUG_ENABLED{false};
        constexpr bool IS_INFO_ENABLED{true};
        constexpr bool IS_WARN_ENABLED{true};
        constexpr bool IS_ERROR_ENABLED{true};
    }

}
