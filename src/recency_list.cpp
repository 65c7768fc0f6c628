#include "leastrecent/recency_list.hpp"

#include <vector>

namespace leastrecent {

RecencyList::RecencyList(std::size_t capacity)
    : capacity_(capacity),
      forward_(SelectPointerWidth(capacity), capacity),
      backward_(forward_.Width(), capacity) {}

void RecencyList::MoveToFront(std::uint32_t slot) {
    if (head_ == slot) {
        return;
    }

    const std::uint32_t previous = backward_.Get(slot);
    const std::uint32_t next = forward_.Get(slot);

    if (tail_ == slot) {
        tail_ = previous;
    } else {
        backward_.Set(next, previous);
    }
    forward_.Set(previous, next);

    // Splice in ahead of the old head.
    backward_.Set(head_, slot);
    forward_.Set(slot, head_);
    head_ = slot;
}

std::uint32_t RecencyList::ClaimSlot() {
    return static_cast<std::uint32_t>(size_++);
}

void RecencyList::PushFront(std::uint32_t slot) {
    if (size_ == 1) {
        // Sole live slot: it is both ends and has no neighbours.
        head_ = slot;
        tail_ = slot;
        return;
    }
    forward_.Set(slot, head_);
    backward_.Set(head_, slot);
    head_ = slot;
}

std::uint32_t RecencyList::EvictTail() {
    const std::uint32_t victim = tail_;
    tail_ = backward_.Get(victim);
    return victim;
}

void RecencyList::Clear() {
    size_ = 0;
    head_ = 0;
    tail_ = 0;
}

bool RecencyList::Validate() const {
    if (size_ > capacity_) {
        return false;
    }
    if (size_ == 0) {
        return true;
    }

    std::vector<bool> seen(capacity_, false);
    std::uint32_t slot = head_;
    std::uint32_t previous = head_;
    for (std::size_t i = 0; i < size_; ++i) {
        if (slot >= capacity_ || seen[slot]) {
            return false;
        }
        if (i > 0 && backward_.Get(slot) != previous) {
            return false;
        }
        seen[slot] = true;
        previous = slot;
        if (i + 1 < size_) {
            slot = forward_.Get(slot);
        }
    }
    return slot == tail_;
}

} // namespace leastrecent
