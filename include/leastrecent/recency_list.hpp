#pragma once

#include "pointer_array.hpp"

#include <cstddef>
#include <cstdint>

namespace leastrecent {

/**
 * @class RecencyList
 * @brief Orders live slots from most recently used (head) to least (tail).
 *
 * The chain is a doubly-linked list laid over two fixed PointerArrays, one
 * cell per slot. Slots are claimed in order 0, 1, 2, ... until the list is
 * full; after that the only way to get a slot is EvictTail().
 *
 * Links of slots that are not live are meaningless. Walks must be bounded
 * by Size(), never by a sentinel.
 *
 * This class is not thread-safe.
 */
class RecencyList {
public:
    explicit RecencyList(std::size_t capacity);

    /**
     * @brief Moves a live slot to the head, keeping every other slot in order.
     * No-op when the slot is already head. Touches at most four cells.
     */
    void MoveToFront(std::uint32_t slot);

    /**
     * @brief Hands out the next never-used slot and counts it as live.
     * Only valid while !Full(). The slot must then go through PushFront().
     */
    std::uint32_t ClaimSlot();

    /**
     * @brief Links a claimed or just-evicted slot in at the head.
     */
    void PushFront(std::uint32_t slot);

    /**
     * @brief Detaches the least recently used slot and returns it.
     * Only valid while Full(). The caller stores the replacement entry and
     * then calls PushFront() with the same slot.
     */
    std::uint32_t EvictTail();

    // Forgets every slot. Link cells are left as they are.
    void Clear();

    std::uint32_t Head() const { return head_; }
    std::uint32_t Tail() const { return tail_; }
    std::uint32_t Next(std::uint32_t slot) const { return forward_.Get(slot); }
    std::uint32_t Prev(std::uint32_t slot) const { return backward_.Get(slot); }

    std::size_t Size() const { return size_; }
    std::size_t Capacity() const { return capacity_; }
    bool Full() const { return size_ == capacity_; }
    bool Empty() const { return size_ == 0; }

    // Bytes used by both link arrays.
    std::size_t Footprint() const { return forward_.Bytes() + backward_.Bytes(); }

    /**
     * @brief Checks that head..tail is a chain of Size() distinct slots with
     * matching back links.
     */
    bool Validate() const;

private:
    std::size_t capacity_;
    PointerArray forward_;  // toward less recently used
    PointerArray backward_; // toward more recently used
    std::size_t size_ = 0;
    std::uint32_t head_ = 0;
    std::uint32_t tail_ = 0;
};

} // namespace leastrecent
