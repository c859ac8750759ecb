#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Active reservations, keyed by user.
 *
 * Red-black tree stored in an arena of nodes addressed by index. Child and
 * parent links are indices into the arena, so rotations and deletions never
 * leave dangling references; freed slots are recycled for later inserts.
 */
class ReservationIndex {
public:
    /** A (user, seat) pairing. */
    struct Entry {
        int32_t userId;
        int32_t seatId;
    };

    /**
     * Insert a reservation.
     * The caller guarantees userId is not already present.
     */
    void insert(int32_t userId, int32_t seatId);

    /** Seat held by userId, or nullopt if the user has no reservation. */
    std::optional<int32_t> search(int32_t userId) const;

    /** Remove userId's reservation. Returns false if there was none. */
    bool remove(int32_t userId);

    /** All reservations in ascending userId order. */
    std::vector<Entry> allEntries() const;

    /** Reservations with lo <= userId <= hi, ascending by userId. */
    std::vector<Entry> entriesInRange(int32_t lo, int32_t hi) const;

    /** All reservations in ascending seatId order (sorted on demand). */
    std::vector<Entry> entriesBySeat() const;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    void clear();

    /**
     * Check BST order, parent links, red-black coloring and black height.
     * @param reason Set to a description of the first violation found
     * @return true if the tree is a valid red-black tree
     */
    bool verifyStructure(std::string &reason) const;

    /** Number of black nodes on every root-to-leaf path (0 for an empty tree). */
    uint32_t blackHeight() const;

private:
    enum class Color : uint8_t { RED, BLACK };

    static constexpr uint32_t NIL = UINT32_MAX;

    struct Node {
        int32_t userId;
        int32_t seatId;
        Color color;
        uint32_t left;
        uint32_t right;
        uint32_t parent;
    };

    std::vector<Node> nodes_;
    std::vector<uint32_t> freeSlots_;
    uint32_t root_{NIL};
    size_t size_{0};

    uint32_t allocate(int32_t userId, int32_t seatId);
    void release(uint32_t idx);

    bool isRed(uint32_t idx) const { return idx != NIL && nodes_[idx].color == Color::RED; }
    uint32_t find(int32_t userId) const;
    uint32_t minimum(uint32_t idx) const;

    void rotateLeft(uint32_t x);
    void rotateRight(uint32_t y);
    void transplant(uint32_t u, uint32_t v);
    void fixInsert(uint32_t z);
    void fixRemove(uint32_t x, uint32_t xParent);

    int64_t verifySubtree(uint32_t idx, uint32_t expectedParent,
                          const int32_t *lowerBound, const int32_t *upperBound,
                          std::string &reason) const;
};
