// M1.4 - Randomized concurrent uploads of overlapping layers keep slots injective

#include "sc/config/EngineConfig.hpp"
#include "sc/tiles/HostTileDevice.hpp"
#include "sc/tiles/TileStorage.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <set>
#include <thread>
#include <utility>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  constexpr int kThreads = 8;
  constexpr int kIterations = 25;

  sc::HostTileDevice dev(32);
  sc::EngineConfig cfg;
  cfg.tilesPerPile = 16;
  sc::TileStorage storage(dev, cfg);

  const sc::LayerId layers[3] = {sc::nextLayerId(), sc::nextLayerId(), sc::nextLayerId()};

  std::atomic<bool> go{false};
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; t++) {
    threads.emplace_back([&, t]() {
      std::mt19937 rng(1234u + static_cast<unsigned>(t));
      std::uniform_int_distribution<int> pickLayer(0, 2);
      std::uniform_int_distribution<std::uint32_t> pickSize(1, 150);
      while (!go.load()) std::this_thread::yield();
      for (int i = 0; i < kIterations; i++) {
        sc::PixelBuffer px = sc::PixelBuffer::filled(pickSize(rng), pickSize(rng),
                                                     static_cast<float>(t) / kThreads, 0, 0, 1);
        if (!storage.upload(layers[pickLayer(rng)], px).ok) failures++;
      }
    });
  }
  go.store(true);
  for (auto& th : threads) th.join();

  requireTrue(failures.load() == 0, "all uploads succeeded");

  std::set<std::pair<std::uint32_t, std::uint32_t>> slots;
  std::size_t tileCount = 0;
  for (sc::LayerId layer : layers) {
    for (const sc::Tile& t : storage.index().tilesForLayer(layer)) {
      requireTrue(!t.isSentinel(), "published tile is not the sentinel");
      requireTrue(storage.index().get(t.key).slot == t.slot, "lookup matches");
      slots.insert({t.slot.pile, t.slot.layer});
      tileCount++;
    }
  }
  std::printf("  %zu tiles in %u piles\n", tileCount, storage.allocator().pileCount());

  requireTrue(tileCount == storage.index().size(), "index size matches");
  requireTrue(slots.size() == tileCount, "no two keys share a slot");

  std::size_t total = static_cast<std::size_t>(storage.allocator().pileCount()) *
                      storage.allocator().capacity();
  requireTrue(storage.allocator().freeSlotCount() + tileCount == total, "no slot leaked");

  std::printf("M1.4 concurrent_upload: ALL PASS\n");
  return 0;
}
