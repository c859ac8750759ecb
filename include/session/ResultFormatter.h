#pragma once

#include <string>
#include <vector>

#include "booking/BookingResult.h"

/**
 * @brief Rendering of booking results as output lines.
 */
namespace ResultFormatter {
    /**
     * @brief Render a result as zero or more lines (without newline).
     * @param result Result returned by a BookingOrchestrator operation
     */
    std::vector<std::string> format(const BookingResult &result);

    /** @brief Line written when the session receives Quit(). */
    const char *terminationLine();
}
