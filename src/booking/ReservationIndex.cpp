#include "booking/ReservationIndex.h"

#include <algorithm>

void ReservationIndex::insert(int32_t userId, int32_t seatId) {
    const uint32_t z = allocate(userId, seatId);

    uint32_t parent = NIL;
    uint32_t current = root_;
    while (current != NIL) {
        parent = current;
        current = (userId < nodes_[current].userId) ? nodes_[current].left : nodes_[current].right;
    }

    nodes_[z].parent = parent;
    if (parent == NIL) {
        root_ = z;
    } else if (userId < nodes_[parent].userId) {
        nodes_[parent].left = z;
    } else {
        nodes_[parent].right = z;
    }

    ++size_;
    fixInsert(z);
}

std::optional<int32_t> ReservationIndex::search(int32_t userId) const {
    const uint32_t idx = find(userId);
    if (idx == NIL) {
        return std::nullopt;
    }
    return nodes_[idx].seatId;
}

bool ReservationIndex::remove(int32_t userId) {
    const uint32_t z = find(userId);
    if (z == NIL) {
        return false;
    }

    uint32_t x;
    uint32_t xParent;
    Color removedColor = nodes_[z].color;

    if (nodes_[z].left == NIL) {
        x = nodes_[z].right;
        xParent = nodes_[z].parent;
        transplant(z, nodes_[z].right);
    } else if (nodes_[z].right == NIL) {
        x = nodes_[z].left;
        xParent = nodes_[z].parent;
        transplant(z, nodes_[z].left);
    } else {
        // Two children: the in-order successor takes z's place
        const uint32_t y = minimum(nodes_[z].right);
        removedColor = nodes_[y].color;
        x = nodes_[y].right;

        if (nodes_[y].parent == z) {
            xParent = y;
        } else {
            xParent = nodes_[y].parent;
            transplant(y, nodes_[y].right);
            nodes_[y].right = nodes_[z].right;
            nodes_[nodes_[y].right].parent = y;
        }
        transplant(z, y);
        nodes_[y].left = nodes_[z].left;
        nodes_[nodes_[y].left].parent = y;
        nodes_[y].color = nodes_[z].color;
    }

    if (removedColor == Color::BLACK) {
        fixRemove(x, xParent);
    }

    release(z);
    --size_;
    return true;
}

std::vector<ReservationIndex::Entry> ReservationIndex::allEntries() const {
    std::vector<Entry> result;
    result.reserve(size_);

    std::vector<uint32_t> stack;
    uint32_t current = root_;
    while (current != NIL || !stack.empty()) {
        while (current != NIL) {
            stack.push_back(current);
            current = nodes_[current].left;
        }
        current = stack.back();
        stack.pop_back();
        result.push_back({nodes_[current].userId, nodes_[current].seatId});
        current = nodes_[current].right;
    }
    return result;
}

std::vector<ReservationIndex::Entry> ReservationIndex::entriesInRange(int32_t lo, int32_t hi) const {
    std::vector<Entry> result;
    if (lo > hi) {
        return result;
    }

    // In-order walk that skips subtrees entirely outside [lo, hi]
    std::vector<uint32_t> stack;
    uint32_t current = root_;
    while (current != NIL || !stack.empty()) {
        while (current != NIL) {
            if (nodes_[current].userId < lo) {
                current = nodes_[current].right;
                continue;
            }
            stack.push_back(current);
            current = nodes_[current].left;
        }
        if (stack.empty()) {
            break;
        }
        current = stack.back();
        stack.pop_back();
        if (nodes_[current].userId > hi) {
            break;
        }
        result.push_back({nodes_[current].userId, nodes_[current].seatId});
        current = nodes_[current].right;
    }
    return result;
}

std::vector<ReservationIndex::Entry> ReservationIndex::entriesBySeat() const {
    std::vector<Entry> result = allEntries();
    std::sort(result.begin(), result.end(), [](const Entry &a, const Entry &b) {
        return a.seatId < b.seatId;
    });
    return result;
}

void ReservationIndex::clear() {
    nodes_.clear();
    freeSlots_.clear();
    root_ = NIL;
    size_ = 0;
}

uint32_t ReservationIndex::blackHeight() const {
    uint32_t height = 0;
    for (uint32_t idx = root_; idx != NIL; idx = nodes_[idx].left) {
        if (!isRed(idx)) ++height;
    }
    return height;
}

bool ReservationIndex::verifyStructure(std::string &reason) const {
    reason.clear();
    if (root_ == NIL) {
        if (size_ != 0) {
            reason = "empty tree reports non-zero size";
            return false;
        }
        return true;
    }
    if (isRed(root_)) {
        reason = "root is red";
        return false;
    }
    if (verifySubtree(root_, NIL, nullptr, nullptr, reason) < 0) {
        return false;
    }
    if (allEntries().size() != size_) {
        reason = "node count differs from size";
        return false;
    }
    return true;
}

// ==================== Arena ====================

uint32_t ReservationIndex::allocate(int32_t userId, int32_t seatId) {
    const Node node{userId, seatId, Color::RED, NIL, NIL, NIL};
    if (!freeSlots_.empty()) {
        const uint32_t idx = freeSlots_.back();
        freeSlots_.pop_back();
        nodes_[idx] = node;
        return idx;
    }
    nodes_.push_back(node);
    return static_cast<uint32_t>(nodes_.size() - 1);
}

void ReservationIndex::release(uint32_t idx) {
    nodes_[idx].left = nodes_[idx].right = nodes_[idx].parent = NIL;
    freeSlots_.push_back(idx);
}

// ==================== Tree primitives ====================

uint32_t ReservationIndex::find(int32_t userId) const {
    uint32_t current = root_;
    while (current != NIL) {
        if (userId == nodes_[current].userId) {
            return current;
        }
        current = (userId < nodes_[current].userId) ? nodes_[current].left : nodes_[current].right;
    }
    return NIL;
}

uint32_t ReservationIndex::minimum(uint32_t idx) const {
    while (nodes_[idx].left != NIL) {
        idx = nodes_[idx].left;
    }
    return idx;
}

void ReservationIndex::rotateLeft(uint32_t x) {
    const uint32_t y = nodes_[x].right;
    nodes_[x].right = nodes_[y].left;
    if (nodes_[y].left != NIL) {
        nodes_[nodes_[y].left].parent = x;
    }
    nodes_[y].parent = nodes_[x].parent;
    if (nodes_[x].parent == NIL) {
        root_ = y;
    } else if (x == nodes_[nodes_[x].parent].left) {
        nodes_[nodes_[x].parent].left = y;
    } else {
        nodes_[nodes_[x].parent].right = y;
    }
    nodes_[y].left = x;
    nodes_[x].parent = y;
}

void ReservationIndex::rotateRight(uint32_t y) {
    const uint32_t x = nodes_[y].left;
    nodes_[y].left = nodes_[x].right;
    if (nodes_[x].right != NIL) {
        nodes_[nodes_[x].right].parent = y;
    }
    nodes_[x].parent = nodes_[y].parent;
    if (nodes_[y].parent == NIL) {
        root_ = x;
    } else if (y == nodes_[nodes_[y].parent].right) {
        nodes_[nodes_[y].parent].right = x;
    } else {
        nodes_[nodes_[y].parent].left = x;
    }
    nodes_[x].right = y;
    nodes_[y].parent = x;
}

void ReservationIndex::transplant(uint32_t u, uint32_t v) {
    const uint32_t parent = nodes_[u].parent;
    if (parent == NIL) {
        root_ = v;
    } else if (u == nodes_[parent].left) {
        nodes_[parent].left = v;
    } else {
        nodes_[parent].right = v;
    }
    if (v != NIL) {
        nodes_[v].parent = parent;
    }
}

void ReservationIndex::fixInsert(uint32_t z) {
    while (z != root_ && isRed(nodes_[z].parent)) {
        uint32_t parent = nodes_[z].parent;
        // A red parent is never the root, so the grandparent exists
        const uint32_t grandParent = nodes_[parent].parent;

        if (parent == nodes_[grandParent].left) {
            const uint32_t uncle = nodes_[grandParent].right;
            if (isRed(uncle)) {
                nodes_[parent].color = Color::BLACK;
                nodes_[uncle].color = Color::BLACK;
                nodes_[grandParent].color = Color::RED;
                z = grandParent;
            } else {
                if (z == nodes_[parent].right) {
                    z = parent;
                    rotateLeft(z);
                    parent = nodes_[z].parent;
                }
                nodes_[parent].color = Color::BLACK;
                nodes_[grandParent].color = Color::RED;
                rotateRight(grandParent);
            }
        } else {
            const uint32_t uncle = nodes_[grandParent].left;
            if (isRed(uncle)) {
                nodes_[parent].color = Color::BLACK;
                nodes_[uncle].color = Color::BLACK;
                nodes_[grandParent].color = Color::RED;
                z = grandParent;
            } else {
                if (z == nodes_[parent].left) {
                    z = parent;
                    rotateRight(z);
                    parent = nodes_[z].parent;
                }
                nodes_[parent].color = Color::BLACK;
                nodes_[grandParent].color = Color::RED;
                rotateLeft(grandParent);
            }
        }
    }
    nodes_[root_].color = Color::BLACK;
}

void ReservationIndex::fixRemove(uint32_t x, uint32_t xParent) {
    // x carries an extra black; it may be NIL, so its parent is tracked separately
    while (x != root_ && !isRed(x)) {
        if (x == nodes_[xParent].left) {
            uint32_t w = nodes_[xParent].right;
            if (isRed(w)) {
                nodes_[w].color = Color::BLACK;
                nodes_[xParent].color = Color::RED;
                rotateLeft(xParent);
                w = nodes_[xParent].right;
            }
            if (!isRed(nodes_[w].left) && !isRed(nodes_[w].right)) {
                nodes_[w].color = Color::RED;
                x = xParent;
                xParent = nodes_[x].parent;
            } else {
                if (!isRed(nodes_[w].right)) {
                    nodes_[nodes_[w].left].color = Color::BLACK;
                    nodes_[w].color = Color::RED;
                    rotateRight(w);
                    w = nodes_[xParent].right;
                }
                nodes_[w].color = nodes_[xParent].color;
                nodes_[xParent].color = Color::BLACK;
                if (nodes_[w].right != NIL) {
                    nodes_[nodes_[w].right].color = Color::BLACK;
                }
                rotateLeft(xParent);
                x = root_;
                xParent = NIL;
            }
        } else {
            uint32_t w = nodes_[xParent].left;
            if (isRed(w)) {
                nodes_[w].color = Color::BLACK;
                nodes_[xParent].color = Color::RED;
                rotateRight(xParent);
                w = nodes_[xParent].left;
            }
            if (!isRed(nodes_[w].right) && !isRed(nodes_[w].left)) {
                nodes_[w].color = Color::RED;
                x = xParent;
                xParent = nodes_[x].parent;
            } else {
                if (!isRed(nodes_[w].left)) {
                    nodes_[nodes_[w].right].color = Color::BLACK;
                    nodes_[w].color = Color::RED;
                    rotateLeft(w);
                    w = nodes_[xParent].left;
                }
                nodes_[w].color = nodes_[xParent].color;
                nodes_[xParent].color = Color::BLACK;
                if (nodes_[w].left != NIL) {
                    nodes_[nodes_[w].left].color = Color::BLACK;
                }
                rotateRight(xParent);
                x = root_;
                xParent = NIL;
            }
        }
    }
    if (x != NIL) {
        nodes_[x].color = Color::BLACK;
    }
}

// ==================== Validation ====================

int64_t ReservationIndex::verifySubtree(uint32_t idx, uint32_t expectedParent,
                                        const int32_t *lowerBound, const int32_t *upperBound,
                                        std::string &reason) const {
    if (idx == NIL) {
        return 1;
    }
    const Node &node = nodes_[idx];
    const std::string at = " at user " + std::to_string(node.userId);

    if (node.parent != expectedParent) {
        reason = "broken parent link" + at;
        return -1;
    }
    if ((lowerBound && node.userId <= *lowerBound) || (upperBound && node.userId >= *upperBound)) {
        reason = "search order violated" + at;
        return -1;
    }
    if (node.color == Color::RED && (isRed(node.left) || isRed(node.right))) {
        reason = "red node with red child" + at;
        return -1;
    }

    const int64_t leftHeight = verifySubtree(node.left, idx, lowerBound, &node.userId, reason);
    if (leftHeight < 0) return -1;
    const int64_t rightHeight = verifySubtree(node.right, idx, &node.userId, upperBound, reason);
    if (rightHeight < 0) return -1;

    if (leftHeight != rightHeight) {
        reason = "black height mismatch" + at;
        return -1;
    }
    return leftHeight + (node.color == Color::BLACK ? 1 : 0);
}
