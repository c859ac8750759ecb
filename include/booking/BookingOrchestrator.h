#pragma once

#include <cstdint>

#include "booking/BookingResult.h"
#include "booking/ReservationIndex.h"
#include "booking/SeatPool.h"
#include "booking/WaitlistQueue.h"

/**
 * Seat booking engine.
 *
 * Owns the reservation index, the waitlist and the free seat pool and keeps
 * them mutually consistent: every seat in [1, totalSeats] is either reserved
 * or free, and no user is both reserved and waiting.
 *
 * Single-threaded. A caller sharing one instance between threads must wrap
 * every operation in one exclusive lock, since cancel, addSeats and
 * releaseSeats each touch several structures.
 */
class BookingOrchestrator {
public:
    /** Reset all state and make seats 1..seatCount available. */
    BookingResult initialize(int32_t seatCount);

    /** Report free seat count and waitlist length. */
    BookingResult available() const;

    /** Assign the lowest free seat, or put the user on the waitlist. */
    BookingResult reserve(int32_t userId, int32_t priority);

    /** Cancel userId's reservation of seatId; the seat goes to the top waiter if any. */
    BookingResult cancel(int32_t seatId, int32_t userId);

    /** Grow the pool by count seats, serving waiters first. */
    BookingResult addSeats(int32_t count);

    BookingResult exitWaitlist(int32_t userId);

    BookingResult updatePriority(int32_t userId, int32_t priority);

    /**
     * Drop reservations and waitlist entries of every user in [lo, hi], then
     * hand the freed seats (ascending) to the remaining waiters (by priority).
     */
    BookingResult releaseSeats(int32_t lo, int32_t hi);

    /** All reservations sorted by seat. */
    BookingResult printReservations() const;

    int32_t totalSeats() const { return totalSeats_; }
    bool isInitialized() const { return initialized_; }

    const ReservationIndex &reservations() const { return reservations_; }
    const WaitlistQueue &waitlist() const { return waitlist_; }
    const SeatPool &seatPool() const { return seatPool_; }

private:
    ReservationIndex reservations_;
    WaitlistQueue waitlist_;
    SeatPool seatPool_;
    int32_t totalSeats_{0};
    bool initialized_{false};

    /** Record a waiter as the holder of seatId. */
    SeatAssignment seatWaiter(const WaitlistEntry &waiter, int32_t seatId);
};
