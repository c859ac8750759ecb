#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/**
 * Single entry in the waitlist.
 * Represents a user waiting for a seat to become free.
 */
struct WaitlistEntry {
    int32_t userId;
    int32_t priority;   // Higher value is served first
    uint64_t sequence;  // Arrival order, breaks priority ties (lower wins)

    WaitlistEntry() : userId{0}, priority{0}, sequence{0} {
    }

    WaitlistEntry(int32_t userId_, int32_t priority_, uint64_t sequence_)
        : userId{userId_}, priority{priority_}, sequence{sequence_} {
    }
};

/**
 * Priority queue of waiting users.
 *
 * Binary max-heap ordered by (priority desc, sequence asc). Besides the
 * usual insert/extract it supports removal and re-keying of an arbitrary
 * user; both locate the entry with a linear scan and then repair the heap
 * in logarithmic time.
 */
class WaitlistQueue {
public:
    /**
     * Heap comparator. True if a must be served before b.
     * Sequences are unique, so the relation is a strict total order.
     */
    static bool hasHigherPriority(const WaitlistEntry &a, const WaitlistEntry &b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.sequence < b.sequence;
    }

    /** Add user with the next arrival sequence number. */
    void insert(int32_t userId, int32_t priority);

    /** Remove and return the entry served next, or nullopt when empty. */
    std::optional<WaitlistEntry> extractTop();

    /** Entry served next without removing it. */
    const WaitlistEntry *top() const { return heap_.empty() ? nullptr : &heap_.front(); }

    /** Remove user. Returns false (and changes nothing) if absent. */
    bool remove(int32_t userId);

    /**
     * Change a user's priority, keeping the original sequence number.
     * Returns false (and changes nothing) if absent.
     */
    bool updatePriority(int32_t userId, int32_t newPriority);

    bool contains(int32_t userId) const { return indexOf(userId) >= 0; }
    const WaitlistEntry *find(int32_t userId) const;

    bool isEmpty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }

    /** Drop all entries and restart the arrival sequence. */
    void clear();

    /** Heap storage in heap order (root first). */
    const std::vector<WaitlistEntry> &entries() const { return heap_; }

private:
    std::vector<WaitlistEntry> heap_;
    uint64_t nextSequence_{0};

    /** Find user. Returns heap index or -1 if not found. */
    std::ptrdiff_t indexOf(int32_t userId) const;

    void siftUp(size_t index);
    void siftDown(size_t index);
};
