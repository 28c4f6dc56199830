// M1.2 - TileAddressIndex: sentinel lookups, idempotent allocation, racing callers

#include "sc/tiles/HostTileDevice.hpp"
#include "sc/tiles/PileAllocator.hpp"
#include "sc/tiles/TileAddressIndex.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Holds every pile creation until all racers have arrived, then stalls a
// little longer so the others get past their lookup while the first caller
// is still inside the allocator.
class GatedDevice : public sc::TileDevice {
public:
  GatedDevice(std::uint32_t tileSize, int racers) : host_(tileSize), racers_(racers) {}

  void arrive() {
    std::lock_guard<std::mutex> lock(mtx_);
    arrived_++;
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    arrived_ = 0;
  }

  std::uint32_t tileSize() const override { return host_.tileSize(); }
  sc::PileHandle sentinelPile() const override { return host_.sentinelPile(); }
  std::unique_ptr<sc::UploadBatch> beginUpload(std::size_t bytes) override {
    return host_.beginUpload(bytes);
  }

  sc::PileCreateResult createPile(std::uint32_t capacity) override {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait_for(lock, std::chrono::seconds(2), [this] { return arrived_ >= racers_; });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return host_.createPile(capacity);
  }

private:
  sc::HostTileDevice host_;
  const int racers_;
  std::mutex mtx_;
  std::condition_variable cv_;
  int arrived_{0};
};

int main() {
  sc::HostTileDevice dev(8);
  sc::PileAllocator alloc(dev, 16);
  sc::TileAddressIndex index(alloc, dev.sentinelPile());

  // --- Test 1: unknown key -> sentinel with the requested coordinate ---
  {
    sc::LayerId layer = sc::nextLayerId();
    sc::Tile t = index.get(sc::TileKey{layer, sc::TileCoord{3, 5}});
    requireTrue(t.isSentinel(), "miss returns the sentinel");
    requireTrue(t.key.coord.x == 3 && t.key.coord.y == 5, "coordinate patched");
    requireTrue(t.view.pile == dev.sentinelPile(), "sentinel view");
    requireTrue(t.slot.pile == sc::kSentinelPileIndex, "sentinel pile index");
    requireTrue(index.sentinel().key.coord.x == 0 && index.sentinel().key.coord.y == 0,
                "stored sentinel unchanged");
    requireTrue(alloc.pileCount() == 0, "get never allocates");
    requireTrue(index.size() == 0, "no published tiles");
    std::printf("  Test 1 (sentinel lookup) PASS\n");
  }

  // --- Test 2: getOrAllocate is idempotent ---
  {
    sc::LayerId layer = sc::nextLayerId();
    sc::TileKey key{layer, sc::TileCoord{1, 2}};

    sc::TileResult a = index.getOrAllocate(key);
    requireTrue(a.ok, "first getOrAllocate ok");
    requireTrue(!a.tile.isSentinel(), "real tile");
    requireTrue(a.tile.key == key, "tile carries its key");

    sc::TileResult b = index.getOrAllocate(key);
    requireTrue(b.ok && b.tile.slot == a.tile.slot, "second call returns same slot");
    requireTrue(index.get(key).slot == a.tile.slot, "get sees the published tile");
    requireTrue(index.size() == 1, "one published tile");
    requireTrue(alloc.pileCount() == 1, "one pile");
    requireTrue(index.tilesForLayer(layer).size() == 1, "tilesForLayer");

    sc::TileResult bad = index.getOrAllocate(sc::TileKey{sc::kSentinelLayerId, sc::TileCoord{0, 0}});
    requireTrue(!bad.ok, "sentinel layer rejected");
    requireTrue(bad.err.code == sc::kErrInvalidLayer, "INVALID_LAYER code");
    std::printf("  Test 2 (idempotent allocation) PASS\n");
  }

  // --- Test 3: threads racing on the same keys leak no slot ---
  {
    constexpr int kThreads = 8;
    constexpr std::uint32_t kKeys = 64;
    sc::LayerId layer = sc::nextLayerId();
    std::size_t before = index.size();

    std::atomic<bool> go{false};
    std::vector<std::vector<sc::PhysicalTileSlot>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
      threads.emplace_back([&, t]() {
        while (!go.load()) std::this_thread::yield();
        for (std::uint32_t k = 0; k < kKeys; k++) {
          sc::TileResult r = index.getOrAllocate(sc::TileKey{layer, sc::TileCoord{k, 0}});
          seen[t].push_back(r.ok ? r.tile.slot : sc::PhysicalTileSlot{sc::kSentinelPileIndex, 0});
        }
      });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    for (int t = 1; t < kThreads; t++) {
      for (std::uint32_t k = 0; k < kKeys; k++) {
        requireTrue(seen[t][k] == seen[0][k], "every caller sees the winner's slot");
      }
    }
    for (std::uint32_t k = 0; k < kKeys; k++) {
      requireTrue(seen[0][k].pile != sc::kSentinelPileIndex, "allocation succeeded");
    }

    requireTrue(index.size() == before + kKeys, "one tile per key");
    std::size_t total = static_cast<std::size_t>(alloc.pileCount()) * alloc.capacity();
    requireTrue(alloc.freeSlotCount() + index.size() == total, "no slot leaked");
    requireTrue(alloc.returnedSlotCount() == index.lostRaceCount(),
                "every lost race returned its slot");

    std::printf("  Test 3 (racing getOrAllocate, lost races: %llu) PASS\n",
                static_cast<unsigned long long>(index.lostRaceCount()));
  }

  // --- Test 4: a caller that loses the publish returns its slot ---
  {
    constexpr int kThreads = 4;
    constexpr int kMaxRounds = 50;
    GatedDevice gated(8, kThreads);
    sc::PileAllocator gatedAlloc(gated, 1); // one slot per pile: every miss creates a pile
    sc::TileAddressIndex gatedIndex(gatedAlloc, gated.sentinelPile());
    sc::LayerId layer = sc::nextLayerId();

    int rounds = 0;
    for (; rounds < kMaxRounds && gatedIndex.lostRaceCount() == 0; rounds++) {
      gated.reset();
      sc::TileKey key{layer, sc::TileCoord{static_cast<std::uint32_t>(rounds), 0}};
      std::vector<sc::PhysicalTileSlot> seen(kThreads);
      std::vector<std::thread> threads;
      for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&, t]() {
          gated.arrive();
          sc::TileResult r = gatedIndex.getOrAllocate(key);
          requireTrue(r.ok, "racing allocation ok");
          seen[t] = r.tile.slot;
        });
      }
      for (auto& th : threads) th.join();
      for (int t = 1; t < kThreads; t++) {
        requireTrue(seen[t] == seen[0], "all racers agree on the published slot");
      }
    }

    requireTrue(gatedIndex.lostRaceCount() > 0, "losing-racer path taken");
    requireTrue(gatedIndex.size() == static_cast<std::size_t>(rounds), "one tile per key");
    requireTrue(gatedAlloc.returnedSlotCount() == gatedIndex.lostRaceCount(),
                "every lost race returned its slot");
    std::size_t total = static_cast<std::size_t>(gatedAlloc.pileCount()) * gatedAlloc.capacity();
    requireTrue(gatedAlloc.freeSlotCount() + gatedIndex.size() == total, "no slot leaked");

    std::printf("  Test 4 (forced lost race after %d round(s), lost races: %llu) PASS\n",
                rounds, static_cast<unsigned long long>(gatedIndex.lostRaceCount()));
  }

  std::printf("M1.2 tile_index: ALL PASS\n");
  return 0;
}
