#include "sc/tiles/PileAllocator.hpp"

#include <cstdio>
#include <string>

namespace sc {

PileAllocator::PileAllocator(TileDevice& device, std::uint32_t tilesPerPile,
                             std::uint32_t maxPiles)
    : device_(device), capacity_(tilesPerPile == 0 ? 1 : tilesPerPile), maxPiles_(maxPiles) {
  if (tilesPerPile == 0) {
    std::fprintf(stderr, "PileAllocator: tilesPerPile of 0 clamped to 1\n");
  }
}

SlotResult PileAllocator::allocateSlot() {
  std::lock_guard<std::mutex> lock(mtx_);
  SlotResult r;

  if (!freeSlots_.empty()) {
    r.slot = freeSlots_.back();
    freeSlots_.pop_back();
    r.pile = piles_[r.slot.pile];
    return r;
  }

  if (exhausted_) {
    r.ok = false;
    r.err = exhaustedErr_;
    return r;
  }

  if (maxPiles_ != 0 && piles_.size() >= maxPiles_) {
    exhausted_ = true;
    exhaustedErr_ = makeError(kErrOutOfDeviceMemory,
        "pile budget of " + std::to_string(maxPiles_) + " piles exhausted");
    std::fprintf(stderr, "PileAllocator: %s\n", exhaustedErr_.message.c_str());
    r.ok = false;
    r.err = exhaustedErr_;
    return r;
  }

  PileCreateResult created = device_.createPile(capacity_);
  if (!created.ok) {
    exhausted_ = true;
    exhaustedErr_ = created.err;
    std::fprintf(stderr, "PileAllocator: pile creation failed: %s\n",
                 created.err.message.c_str());
    r.ok = false;
    r.err = created.err;
    return r;
  }

  auto pileIndex = static_cast<std::uint32_t>(piles_.size());
  piles_.push_back(created.handle);
  std::fprintf(stderr, "PileAllocator: allocated new tile pile. Current pile count: %zu\n",
               piles_.size());

  // Slot 0 goes to the caller; the rest pop in ascending order.
  freeSlots_.reserve(freeSlots_.size() + capacity_ - 1);
  for (std::uint32_t layer = capacity_; layer-- > 1;) {
    freeSlots_.push_back(PhysicalTileSlot{pileIndex, layer});
  }

  r.slot = PhysicalTileSlot{pileIndex, 0};
  r.pile = created.handle;
  return r;
}

void PileAllocator::returnUnpublished(const PhysicalTileSlot& slot) {
  std::lock_guard<std::mutex> lock(mtx_);
  freeSlots_.push_back(slot);
  returned_++;
}

PileHandle PileAllocator::pile(std::uint32_t index) const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (index >= piles_.size()) return kNullPile;
  return piles_[index];
}

std::uint32_t PileAllocator::pileCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return static_cast<std::uint32_t>(piles_.size());
}

std::size_t PileAllocator::freeSlotCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return freeSlots_.size();
}

std::uint64_t PileAllocator::returnedSlotCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return returned_;
}

bool PileAllocator::exhausted() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return exhausted_;
}

} // namespace sc
