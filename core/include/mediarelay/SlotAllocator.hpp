// Fixed pool of execution slots. Slots 0..B-1 are BulkReserved and
// B..N-1 InteractiveReserved. Interactive work may borrow an idle
// BulkReserved slot; Bulk work never takes an InteractiveReserved one.
#pragma once
#include "TransferTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mediarelay {

struct Slot {
    int id = -1;
    SlotKind kind = SlotKind::BulkReserved;
    bool occupied = false;
    std::string taskId;
    PriorityClass priorityClass = PriorityClass::Bulk;
};

// Not synchronized; guarded by the scheduler mutex like TaskQueue.
class SlotAllocator {
public:
    // Negative counts are treated as 0. Callers validate totals beforehand.
    SlotAllocator(int bulkSlots, int interactiveSlots);

    // Lowest-numbered idle slot the class may use, without occupying it.
    std::optional<int> findFree(PriorityClass p) const;

    // findFree() + occupy().
    std::optional<int> acquire(const std::string &taskId, PriorityClass p);

    // Fails if the slot is busy, out of range, or the class may not use it.
    bool occupy(int slotId, const std::string &taskId, PriorityClass p);

    // Returns the slot to the free list. False if it was already idle, so a
    // second release of the same run is detectable.
    bool release(int slotId);

    const Slot *slot(int slotId) const;
    const std::vector<Slot> &allSlots() const { return slots_; }

    int totalSlots() const { return static_cast<int>(slots_.size()); }
    int bulkSlots() const { return bulkSlots_; }
    int interactiveSlots() const { return interactiveSlots_; }
    int occupiedCount() const;
    int freeCount() const { return static_cast<int>(freeList_.size()); }
    // Slots (of either kind) currently running a task of class p.
    int occupiedBy(PriorityClass p) const;

private:
    std::optional<int> firstFreeOfKind(SlotKind k) const;

    int bulkSlots_ = 0;
    int interactiveSlots_ = 0;
    std::vector<Slot> slots_;
    // Idle slot ids in ascending order, plus per-kind counters so the
    // borrowing rule is decided without scanning.
    std::vector<int> freeList_;
    int freeBulk_ = 0;
    int freeInteractive_ = 0;
};

} // namespace mediarelay
