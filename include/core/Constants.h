#pragma once

#include <cstdint>

/**
 * @brief Fixed constants of the booking engine.
 * Runtime-tunable values live in Config.h.
 */
namespace Constants {
    namespace Seats {
        constexpr int32_t FIRST_SEAT_ID{1}; // seats are numbered 1..totalSeats
        constexpr int32_t MAX_TOTAL_SEATS{10'000'000}; // upper bound for initialize/addSeats
    }

    namespace Output {
        constexpr const char *DEFAULT_FILE_SUFFIX{"_output_file.txt"};
        constexpr uint32_t MAX_LINE_LENGTH{256};
    }

    namespace Input {
        constexpr uint32_t MAX_COMMAND_ARGS{2};
    }
}
