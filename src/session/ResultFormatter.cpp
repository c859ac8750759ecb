#include "session/ResultFormatter.h"

#include <cstdio>

#include "core/Constants.h"

namespace {
    template<typename... Args>
    std::string line(const char *format, Args... args) {
        char buf[Constants::Output::MAX_LINE_LENGTH];
        int n = snprintf(buf, sizeof(buf), format, args...);
        if (n < 0) {
            return {};
        }
        return std::string(buf);
    }

    void appendReservedLines(const BookingResult &result, std::vector<std::string> &out) {
        for (const SeatAssignment &a : result.assignments) {
            out.push_back(line("User %d reserved seat %d", a.userId, a.seatId));
        }
    }

    std::string invalidInput(const BookingResult &result) {
        if (result.operation == BookingOperation::RELEASE_SEATS) {
            return "Invalid input. Please provide a valid range of users.";
        }
        return "Invalid input. Please provide a valid number of seats.";
    }

    std::string notFound(const BookingResult &result) {
        switch (result.operation) {
            case BookingOperation::CANCEL:
                return line("User %d has no reservation to cancel", result.userId);
            case BookingOperation::EXIT_WAITLIST:
                return line("User %d is not in waitlist", result.userId);
            case BookingOperation::UPDATE_PRIORITY:
                return line("User %d priority is not updated", result.userId);
            default:
                return line("User %d not found", result.userId);
        }
    }
}

namespace ResultFormatter {
    std::vector<std::string> format(const BookingResult &result) {
        std::vector<std::string> out;

        switch (result.outcome) {
            case BookingOutcome::INITIALIZED:
                out.push_back(line("%d Seats are made available for reservation", result.count));
                break;
            case BookingOutcome::AVAILABILITY:
                out.push_back(line("Total Seats Available : %u, Waitlist : %u",
                                   result.availableSeats, result.waitlistSize));
                break;
            case BookingOutcome::RESERVED:
                appendReservedLines(result, out);
                break;
            case BookingOutcome::WAITLISTED:
                out.push_back(line("User %d is added to the waiting list", result.userId));
                break;
            case BookingOutcome::CANCELLED:
                out.push_back(line("User %d canceled their reservation", result.userId));
                appendReservedLines(result, out);
                break;
            case BookingOutcome::SEATS_ADDED:
                out.push_back(line("Additional %d Seats are made available for reservation", result.count));
                appendReservedLines(result, out);
                break;
            case BookingOutcome::WAITLIST_EXITED:
                out.push_back(line("User %d is removed from the waiting list", result.userId));
                break;
            case BookingOutcome::PRIORITY_UPDATED:
                out.push_back(line("User %d priority has been updated to %d", result.userId, result.priority));
                break;
            case BookingOutcome::SEATS_RELEASED:
                out.push_back(line("Reservations of the Users in the range [%d, %d] are released",
                                   result.rangeLow, result.rangeHigh));
                appendReservedLines(result, out);
                break;
            case BookingOutcome::NOTHING_RELEASED:
                out.push_back(line("Reservations/waitlist of the users in the range [%d, %d] have been released",
                                   result.rangeLow, result.rangeHigh));
                break;
            case BookingOutcome::RESERVATION_LIST:
                for (const SeatAssignment &a : result.assignments) {
                    out.push_back(line("Seat %d, User %d", a.seatId, a.userId));
                }
                break;
            case BookingOutcome::INVALID_ARGUMENT:
                out.push_back(invalidInput(result));
                break;
            case BookingOutcome::NOT_FOUND:
                out.push_back(notFound(result));
                break;
            case BookingOutcome::MISMATCH:
                out.push_back(line("User %d has no reservation for seat %d to cancel",
                                   result.userId, result.seatId));
                break;
            case BookingOutcome::DUPLICATE:
                out.push_back(line("User %d already has a reservation or waitlist entry", result.userId));
                break;
        }
        return out;
    }

    const char *terminationLine() {
        return "Program Terminated!!";
    }
}
