#include "booking/BookingOrchestrator.h"

#include <algorithm>
#include <vector>

#include "core/Constants.h"
#include "logging/Logger.h"

namespace {
    constexpr const char *TAG = "Orchestrator";
    constexpr auto SRC = Logger::Source::Orchestrator;
}

BookingResult BookingOrchestrator::initialize(int32_t seatCount) {
    BookingResult result{BookingOperation::INITIALIZE, BookingOutcome::INITIALIZED};
    result.count = seatCount;

    if (seatCount <= 0 || seatCount > Constants::Seats::MAX_TOTAL_SEATS) {
        Logger::warn(SRC, TAG, "Initialize rejected: invalid seat count %d", seatCount);
        result.outcome = BookingOutcome::INVALID_ARGUMENT;
        return result;
    }

    reservations_.clear();
    waitlist_.clear();
    seatPool_.clear();
    totalSeats_ = seatCount;
    initialized_ = true;

    // Ascending inserts never sift, so filling the pool is linear
    for (int32_t seat = Constants::Seats::FIRST_SEAT_ID; seat <= seatCount; ++seat) {
        seatPool_.insert(seat);
    }

    Logger::debug(SRC, TAG, "Initialized with %d seats", seatCount);
    return result;
}

BookingResult BookingOrchestrator::available() const {
    BookingResult result{BookingOperation::AVAILABLE, BookingOutcome::AVAILABILITY};
    result.availableSeats = static_cast<uint32_t>(seatPool_.size());
    result.waitlistSize = static_cast<uint32_t>(waitlist_.size());
    return result;
}

BookingResult BookingOrchestrator::reserve(int32_t userId, int32_t priority) {
    BookingResult result{BookingOperation::RESERVE, BookingOutcome::RESERVED};
    result.userId = userId;
    result.priority = priority;

    if (reservations_.search(userId) || waitlist_.contains(userId)) {
        Logger::warn(SRC, TAG, "Reserve rejected: user %d already reserved or waiting", userId);
        result.outcome = BookingOutcome::DUPLICATE;
        return result;
    }

    std::optional<int32_t> seat = seatPool_.extractMin();
    if (!seat) {
        waitlist_.insert(userId, priority);
        Logger::debug(SRC, TAG, "User %d waitlisted (priority %d, %zu waiting)",
                      userId, priority, waitlist_.size());
        result.outcome = BookingOutcome::WAITLISTED;
        return result;
    }

    reservations_.insert(userId, *seat);
    Logger::debug(SRC, TAG, "User %d -> seat %d", userId, *seat);
    result.seatId = *seat;
    result.assignments.push_back({userId, *seat});
    return result;
}

BookingResult BookingOrchestrator::cancel(int32_t seatId, int32_t userId) {
    BookingResult result{BookingOperation::CANCEL, BookingOutcome::CANCELLED};
    result.userId = userId;
    result.seatId = seatId;

    const std::optional<int32_t> held = reservations_.search(userId);
    if (!held) {
        Logger::warn(SRC, TAG, "Cancel rejected: user %d has no reservation", userId);
        result.outcome = BookingOutcome::NOT_FOUND;
        return result;
    }
    if (*held != seatId) {
        Logger::warn(SRC, TAG, "Cancel rejected: user %d holds seat %d, not %d", userId, *held, seatId);
        result.outcome = BookingOutcome::MISMATCH;
        return result;
    }

    reservations_.remove(userId);

    std::optional<WaitlistEntry> next = waitlist_.extractTop();
    if (next) {
        result.assignments.push_back(seatWaiter(*next, seatId));
    } else {
        seatPool_.insert(seatId);
        Logger::debug(SRC, TAG, "Seat %d returned to pool", seatId);
    }
    return result;
}

BookingResult BookingOrchestrator::addSeats(int32_t count) {
    BookingResult result{BookingOperation::ADD_SEATS, BookingOutcome::SEATS_ADDED};
    result.count = count;

    if (count <= 0 || count > Constants::Seats::MAX_TOTAL_SEATS - totalSeats_) {
        Logger::warn(SRC, TAG, "AddSeats rejected: invalid seat count %d", count);
        result.outcome = BookingOutcome::INVALID_ARGUMENT;
        return result;
    }

    int32_t seat = totalSeats_ + 1;
    totalSeats_ += count;

    // Highest-priority waiter gets the lowest new seat
    while (seat <= totalSeats_) {
        std::optional<WaitlistEntry> next = waitlist_.extractTop();
        if (!next) {
            break;
        }
        result.assignments.push_back(seatWaiter(*next, seat));
        ++seat;
    }
    for (; seat <= totalSeats_; ++seat) {
        seatPool_.insert(seat);
    }

    Logger::debug(SRC, TAG, "Added %d seats (total %d, %zu served from waitlist)",
                  count, totalSeats_, result.assignments.size());
    return result;
}

BookingResult BookingOrchestrator::exitWaitlist(int32_t userId) {
    BookingResult result{BookingOperation::EXIT_WAITLIST, BookingOutcome::WAITLIST_EXITED};
    result.userId = userId;

    if (!waitlist_.remove(userId)) {
        result.outcome = BookingOutcome::NOT_FOUND;
        return result;
    }
    Logger::debug(SRC, TAG, "User %d left the waitlist", userId);
    return result;
}

BookingResult BookingOrchestrator::updatePriority(int32_t userId, int32_t priority) {
    BookingResult result{BookingOperation::UPDATE_PRIORITY, BookingOutcome::PRIORITY_UPDATED};
    result.userId = userId;
    result.priority = priority;

    if (!waitlist_.updatePriority(userId, priority)) {
        result.outcome = BookingOutcome::NOT_FOUND;
        return result;
    }
    Logger::debug(SRC, TAG, "User %d priority -> %d", userId, priority);
    return result;
}

BookingResult BookingOrchestrator::releaseSeats(int32_t lo, int32_t hi) {
    BookingResult result{BookingOperation::RELEASE_SEATS, BookingOutcome::SEATS_RELEASED};
    result.rangeLow = lo;
    result.rangeHigh = hi;

    if (lo > hi) {
        Logger::warn(SRC, TAG, "ReleaseSeats rejected: empty range [%d, %d]", lo, hi);
        result.outcome = BookingOutcome::INVALID_ARGUMENT;
        return result;
    }

    // Sweep only users that exist, not every id in the range
    std::vector<int32_t> freedSeats;
    for (const ReservationIndex::Entry &entry : reservations_.entriesInRange(lo, hi)) {
        reservations_.remove(entry.userId);
        freedSeats.push_back(entry.seatId);
    }

    std::vector<int32_t> leavingWaiters;
    for (const WaitlistEntry &entry : waitlist_.entries()) {
        if (entry.userId >= lo && entry.userId <= hi) {
            leavingWaiters.push_back(entry.userId);
        }
    }
    for (int32_t userId : leavingWaiters) {
        waitlist_.remove(userId);
    }

    if (freedSeats.empty() && leavingWaiters.empty()) {
        result.outcome = BookingOutcome::NOTHING_RELEASED;
        return result;
    }

    Logger::debug(SRC, TAG, "Range [%d, %d]: %zu seats freed, %zu waiters dropped",
                  lo, hi, freedSeats.size(), leavingWaiters.size());

    // Lowest freed seat pairs with the top remaining waiter
    std::sort(freedSeats.begin(), freedSeats.end());
    size_t next = 0;
    for (; next < freedSeats.size(); ++next) {
        std::optional<WaitlistEntry> waiter = waitlist_.extractTop();
        if (!waiter) {
            break;
        }
        result.assignments.push_back(seatWaiter(*waiter, freedSeats[next]));
    }
    for (; next < freedSeats.size(); ++next) {
        seatPool_.insert(freedSeats[next]);
    }
    return result;
}

BookingResult BookingOrchestrator::printReservations() const {
    BookingResult result{BookingOperation::PRINT_RESERVATIONS, BookingOutcome::RESERVATION_LIST};
    for (const ReservationIndex::Entry &entry : reservations_.entriesBySeat()) {
        result.assignments.push_back({entry.userId, entry.seatId});
    }
    return result;
}

SeatAssignment BookingOrchestrator::seatWaiter(const WaitlistEntry &waiter, int32_t seatId) {
    reservations_.insert(waiter.userId, seatId);
    Logger::debug(SRC, TAG, "Waiter %d (priority %d) -> seat %d", waiter.userId, waiter.priority, seatId);
    return {waiter.userId, seatId};
}
