#pragma once
#include "sc/core/EngineError.hpp"
#include "sc/tiles/TileDevice.hpp"
#include "sc/tiles/TileTypes.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace sc {

struct SlotResult {
  bool ok{true};
  EngineError err{};
  PhysicalTileSlot slot{};
  PileHandle pile{kNullPile};
};

// Slab allocator over texture-array piles. No pile exists until the first
// allocation; a new pile is created only when the free list is empty, so
// pile creation happens at most once per `capacity` allocations.
//
// Slots are never released. returnUnpublished() exists only for a slot that
// was allocated but never became visible to anyone (a lost insertion race).
class PileAllocator {
public:
  // maxPiles = 0 means no budget. tilesPerPile = 0 is clamped to 1.
  PileAllocator(TileDevice& device, std::uint32_t tilesPerPile,
                std::uint32_t maxPiles = 0);

  PileAllocator(const PileAllocator&) = delete;
  PileAllocator& operator=(const PileAllocator&) = delete;

  SlotResult allocateSlot();
  void returnUnpublished(const PhysicalTileSlot& slot);

  // kNullPile if index is out of range.
  PileHandle pile(std::uint32_t index) const;

  std::uint32_t capacity() const { return capacity_; }
  std::uint32_t pileCount() const;
  std::size_t freeSlotCount() const;
  std::uint64_t returnedSlotCount() const;

  // Latched after the first OUT_OF_DEVICE_MEMORY.
  bool exhausted() const;

private:
  TileDevice& device_;
  const std::uint32_t capacity_;
  const std::uint32_t maxPiles_;

  mutable std::mutex mtx_;
  std::vector<PileHandle> piles_;
  std::vector<PhysicalTileSlot> freeSlots_; // popped from the back
  std::uint64_t returned_{0};
  bool exhausted_{false};
  EngineError exhaustedErr_{};
};

} // namespace sc
