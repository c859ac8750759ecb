#pragma once

#include <cstdint>
#include <vector>

/**
 * Operation that produced a result.
 */
enum class BookingOperation : uint8_t {
    INITIALIZE,
    AVAILABLE,
    RESERVE,
    CANCEL,
    ADD_SEATS,
    EXIT_WAITLIST,
    UPDATE_PRIORITY,
    RELEASE_SEATS,
    PRINT_RESERVATIONS
};

/**
 * What happened. The last four values are the rejection taxonomy: the
 * operation left all state unchanged.
 */
enum class BookingOutcome : uint8_t {
    INITIALIZED,
    AVAILABILITY,
    RESERVED,
    WAITLISTED,
    CANCELLED,
    SEATS_ADDED,
    WAITLIST_EXITED,
    PRIORITY_UPDATED,
    SEATS_RELEASED,
    NOTHING_RELEASED,
    RESERVATION_LIST,
    INVALID_ARGUMENT,
    NOT_FOUND,
    MISMATCH,
    DUPLICATE
};

/**
 * A seat handed to a user by an operation.
 */
struct SeatAssignment {
    int32_t userId;
    int32_t seatId;

    bool operator==(const SeatAssignment &other) const {
        return userId == other.userId && seatId == other.seatId;
    }
};

/**
 * Structured result of a booking operation.
 *
 * Only the fields meaningful for the outcome are set:
 * - userId/seatId/priority: the user, seat and priority the call referred to
 * - count: seats initialized or added
 * - rangeLow/rangeHigh: releaseSeats bounds
 * - availableSeats/waitlistSize: availability report
 * - assignments: seats handed out by this call in output order (for
 *   printReservations, the full listing sorted by seat)
 */
struct BookingResult {
    BookingOperation operation;
    BookingOutcome outcome;
    int32_t userId;
    int32_t seatId;
    int32_t priority;
    int32_t count;
    int32_t rangeLow;
    int32_t rangeHigh;
    uint32_t availableSeats;
    uint32_t waitlistSize;
    std::vector<SeatAssignment> assignments;

    BookingResult(BookingOperation operation_, BookingOutcome outcome_)
        : operation{operation_}, outcome{outcome_}, userId{0}, seatId{0}, priority{0}, count{0},
          rangeLow{0}, rangeHigh{0}, availableSeats{0}, waitlistSize{0}, assignments{} {
    }

    /** False for rejected operations. */
    bool ok() const {
        switch (outcome) {
            case BookingOutcome::INVALID_ARGUMENT:
            case BookingOutcome::NOT_FOUND:
            case BookingOutcome::MISMATCH:
            case BookingOutcome::DUPLICATE:
                return false;
            default:
                return true;
        }
    }
};

/** Short name for logging. */
inline const char *toString(BookingOutcome outcome) {
    switch (outcome) {
        case BookingOutcome::INITIALIZED: return "INITIALIZED";
        case BookingOutcome::AVAILABILITY: return "AVAILABILITY";
        case BookingOutcome::RESERVED: return "RESERVED";
        case BookingOutcome::WAITLISTED: return "WAITLISTED";
        case BookingOutcome::CANCELLED: return "CANCELLED";
        case BookingOutcome::SEATS_ADDED: return "SEATS_ADDED";
        case BookingOutcome::WAITLIST_EXITED: return "WAITLIST_EXITED";
        case BookingOutcome::PRIORITY_UPDATED: return "PRIORITY_UPDATED";
        case BookingOutcome::SEATS_RELEASED: return "SEATS_RELEASED";
        case BookingOutcome::NOTHING_RELEASED: return "NOTHING_RELEASED";
        case BookingOutcome::RESERVATION_LIST: return "RESERVATION_LIST";
        case BookingOutcome::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case BookingOutcome::NOT_FOUND: return "NOT_FOUND";
        case BookingOutcome::MISMATCH: return "MISMATCH";
        case BookingOutcome::DUPLICATE: return "DUPLICATE";
    }
    return "UNKNOWN";
}
