#include "booking/WaitlistQueue.h"

#include <utility>

void WaitlistQueue::insert(int32_t userId, int32_t priority) {
    heap_.emplace_back(userId, priority, nextSequence_++);
    siftUp(heap_.size() - 1);
}

std::optional<WaitlistEntry> WaitlistQueue::extractTop() {
    if (heap_.empty()) {
        return std::nullopt;
    }
    WaitlistEntry result = heap_.front();
    heap_.front() = heap_.back();
    heap_.pop_back();
    if (!heap_.empty()) {
        siftDown(0);
    }
    return result;
}

bool WaitlistQueue::remove(int32_t userId) {
    const std::ptrdiff_t found = indexOf(userId);
    if (found < 0) {
        return false;
    }
    const auto index = static_cast<size_t>(found);
    std::swap(heap_[index], heap_.back());
    heap_.pop_back();
    if (index < heap_.size()) {
        // Only one of the two has an effect
        siftUp(index);
        siftDown(index);
    }
    return true;
}

bool WaitlistQueue::updatePriority(int32_t userId, int32_t newPriority) {
    const std::ptrdiff_t found = indexOf(userId);
    if (found < 0) {
        return false;
    }
    const auto index = static_cast<size_t>(found);
    heap_[index].priority = newPriority;
    siftUp(index);
    siftDown(index);
    return true;
}

const WaitlistEntry *WaitlistQueue::find(int32_t userId) const {
    const std::ptrdiff_t found = indexOf(userId);
    return found < 0 ? nullptr : &heap_[static_cast<size_t>(found)];
}

void WaitlistQueue::clear() {
    heap_.clear();
    nextSequence_ = 0;
}

std::ptrdiff_t WaitlistQueue::indexOf(int32_t userId) const {
    for (size_t i = 0; i < heap_.size(); ++i) {
        if (heap_[i].userId == userId) {
            return static_cast<std::ptrdiff_t>(i);
        }
    }
    return -1;
}

void WaitlistQueue::siftUp(size_t index) {
    while (index > 0) {
        const size_t parent = (index - 1) / 2;
        if (!hasHigherPriority(heap_[index], heap_[parent])) {
            break;
        }
        std::swap(heap_[index], heap_[parent]);
        index = parent;
    }
}

void WaitlistQueue::siftDown(size_t index) {
    const size_t count = heap_.size();
    while (true) {
        size_t best = index;
        const size_t left = 2 * index + 1;
        const size_t right = left + 1;
        if (left < count && hasHigherPriority(heap_[left], heap_[best])) {
            best = left;
        }
        if (right < count && hasHigherPriority(heap_[right], heap_[best])) {
            best = right;
        }
        if (best == index) {
            break;
        }
        std::swap(heap_[index], heap_[best]);
        index = best;
    }
}
