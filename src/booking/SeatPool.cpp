#include "booking/SeatPool.h"

#include <algorithm>
#include <functional>

void SeatPool::insert(int32_t seatId) {
    heap_.push_back(seatId);
    std::push_heap(heap_.begin(), heap_.end(), std::greater<int32_t>{});
}

std::optional<int32_t> SeatPool::extractMin() {
    if (heap_.empty()) {
        return std::nullopt;
    }
    std::pop_heap(heap_.begin(), heap_.end(), std::greater<int32_t>{});
    int32_t seat = heap_.back();
    heap_.pop_back();
    return seat;
}
