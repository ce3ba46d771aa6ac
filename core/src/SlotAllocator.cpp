#include "mediarelay/SlotAllocator.hpp"

#include <algorithm>

namespace mediarelay {

SlotAllocator::SlotAllocator(int bulkSlots, int interactiveSlots)
    : bulkSlots_(std::max(0, bulkSlots)),
      interactiveSlots_(std::max(0, interactiveSlots)) {
    const int total = bulkSlots_ + interactiveSlots_;
    slots_.reserve(total);
    freeList_.reserve(total);
    for (int i = 0; i < total; ++i) {
        Slot s;
        s.id = i;
        s.kind = (i < bulkSlots_) ? SlotKind::BulkReserved
                                  : SlotKind::InteractiveReserved;
        slots_.push_back(s);
        freeList_.push_back(i);
    }
    freeBulk_ = bulkSlots_;
    freeInteractive_ = interactiveSlots_;
}

std::optional<int> SlotAllocator::firstFreeOfKind(SlotKind k) const {
    for (int id : freeList_) {
        if (slots_[id].kind == k)
            return id;
    }
    return std::nullopt;
}

std::optional<int> SlotAllocator::findFree(PriorityClass p) const {
    if (p == PriorityClass::Interactive) {
        if (freeInteractive_ > 0)
            return firstFreeOfKind(SlotKind::InteractiveReserved);
        if (freeBulk_ > 0)
            return firstFreeOfKind(SlotKind::BulkReserved);
        return std::nullopt;
    }
    if (freeBulk_ > 0)
        return firstFreeOfKind(SlotKind::BulkReserved);
    return std::nullopt;
}

std::optional<int> SlotAllocator::acquire(const std::string &taskId,
                                          PriorityClass p) {
    auto id = findFree(p);
    if (!id || !occupy(*id, taskId, p))
        return std::nullopt;
    return id;
}

bool SlotAllocator::occupy(int slotId, const std::string &taskId,
                           PriorityClass p) {
    if (slotId < 0 || slotId >= totalSlots())
        return false;
    Slot &s = slots_[slotId];
    if (s.occupied)
        return false;
    if (p == PriorityClass::Bulk && s.kind == SlotKind::InteractiveReserved)
        return false;
    auto it = std::find(freeList_.begin(), freeList_.end(), slotId);
    if (it == freeList_.end())
        return false;
    freeList_.erase(it);
    if (s.kind == SlotKind::BulkReserved)
        --freeBulk_;
    else
        --freeInteractive_;
    s.occupied = true;
    s.taskId = taskId;
    s.priorityClass = p;
    return true;
}

bool SlotAllocator::release(int slotId) {
    if (slotId < 0 || slotId >= totalSlots())
        return false;
    Slot &s = slots_[slotId];
    if (!s.occupied)
        return false;
    s.occupied = false;
    s.taskId.clear();
    freeList_.insert(
        std::lower_bound(freeList_.begin(), freeList_.end(), slotId), slotId);
    if (s.kind == SlotKind::BulkReserved)
        ++freeBulk_;
    else
        ++freeInteractive_;
    return true;
}

const Slot *SlotAllocator::slot(int slotId) const {
    if (slotId < 0 || slotId >= totalSlots())
        return nullptr;
    return &slots_[slotId];
}

int SlotAllocator::occupiedCount() const {
    return totalSlots() - freeCount();
}

int SlotAllocator::occupiedBy(PriorityClass p) const {
    return static_cast<int>(
        std::count_if(slots_.begin(), slots_.end(), [p](const Slot &s) {
            return s.occupied && s.priorityClass == p;
        }));
}

} // namespace mediarelay
