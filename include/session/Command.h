#pragma once

#include <cstdint>
#include <string>

#include "core/Constants.h"

/**
 * Commands understood by the booking session, one per input line.
 */
enum class CommandType : uint8_t {
    INITIALIZE,         ///< Initialize(seatCount)
    AVAILABLE,          ///< Available()
    RESERVE,            ///< Reserve(userId, priority)
    CANCEL,             ///< Cancel(seatId, userId)
    EXIT_WAITLIST,      ///< ExitWaitlist(userId)
    UPDATE_PRIORITY,    ///< UpdatePriority(userId, priority)
    ADD_SEATS,          ///< AddSeats(count)
    PRINT_RESERVATIONS, ///< PrintReservations()
    RELEASE_SEATS,      ///< ReleaseSeats(userIdLow, userIdHigh)
    QUIT                ///< Quit()
};

/**
 * A parsed command with its integer arguments in source order.
 */
struct Command {
    CommandType type;
    int32_t args[Constants::Input::MAX_COMMAND_ARGS];
    uint32_t argCount;

    Command() : type{CommandType::QUIT}, args{}, argCount{0} {
    }

    explicit Command(CommandType type_, int32_t first = 0, int32_t second = 0, uint32_t argCount_ = 0)
        : type{type_}, args{first, second}, argCount{argCount_} {
    }
};

/**
 * Outcome of parsing a line.
 */
struct ParseResult {
    enum class Status : uint8_t {
        OK,    ///< command is valid
        BLANK, ///< empty or whitespace-only line, nothing to do
        ERROR  ///< malformed line, error holds the reason
    };

    Status status;
    Command command;
    std::string error;

    ParseResult() : status{Status::BLANK}, command{}, error{} {
    }

    bool ok() const { return status == Status::OK; }
};
