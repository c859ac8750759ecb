#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/**
 * Pool of free seats.
 * Min-heap keyed by seat identifier: extraction always yields the
 * lowest-numbered free seat.
 */
class SeatPool {
public:
    /** Return a seat to the pool. */
    void insert(int32_t seatId);

    /** Remove and return the lowest free seat, or nullopt if the pool is empty. */
    std::optional<int32_t> extractMin();

    bool isEmpty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }
    void clear() { heap_.clear(); }

    /** Heap storage in heap order (root first). */
    const std::vector<int32_t> &seats() const { return heap_; }

private:
    std::vector<int32_t> heap_;
};
