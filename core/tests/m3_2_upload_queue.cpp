// M3.2 - UploadQueue: bounded hand-off from a producer thread

#include "sc/config/EngineConfig.hpp"
#include "sc/tiles/HostTileDevice.hpp"
#include "sc/tiles/TileStorage.hpp"
#include "sc/tiles/UploadQueue.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: full queue refuses and the caller keeps the pixels ---
  {
    sc::HostTileDevice dev(64);
    sc::EngineConfig cfg;
    sc::TileStorage storage(dev, cfg);
    sc::UploadQueue queue(2);

    sc::LayerId a = sc::nextLayerId();
    sc::LayerId b = sc::nextLayerId();
    sc::PendingUpload first{a, sc::PixelBuffer::filled(100, 100, 1, 0, 0, 1)};
    sc::PendingUpload second{b, sc::PixelBuffer::filled(10, 10, 0, 1, 0, 1)};
    sc::PendingUpload third{sc::nextLayerId(), sc::PixelBuffer::filled(10, 10, 0, 0, 1, 1)};

    requireTrue(queue.submit(first), "first accepted");
    requireTrue(queue.submit(second), "second accepted");
    requireTrue(!queue.submit(third), "third refused");
    requireTrue(third.pixels.valid(), "refused upload still owned by caller");
    requireTrue(queue.pending() == 2, "two pending");
    requireTrue(dev.batchesSubmitted() == 0, "nothing uploaded before drain");

    std::vector<sc::CompletedUpload> done = queue.drainInto(storage.uploader());
    requireTrue(done.size() == 2, "two completed");
    requireTrue(done[0].layer == a && done[1].layer == b, "submission order");
    requireTrue(done[0].result.ok && done[0].result.tilesWritten == 4, "first result");
    requireTrue(done[1].result.ok && done[1].result.tilesWritten == 1, "second result");
    requireTrue(queue.pending() == 0, "drained");
    requireTrue(queue.submit(third), "room again after drain");
    std::printf("  Test 1 (bounded queue) PASS\n");
  }

  // --- Test 2: background producer, device-thread consumer ---
  {
    constexpr int kUploads = 12;
    sc::HostTileDevice dev(32);
    sc::EngineConfig cfg;
    cfg.tilesPerPile = 8;
    sc::TileStorage storage(dev, cfg);
    sc::UploadQueue queue(3);

    std::vector<sc::LayerId> layers;
    for (int i = 0; i < kUploads; i++) layers.push_back(sc::nextLayerId());

    std::thread producer([&]() {
      for (int i = 0; i < kUploads; i++) {
        sc::PendingUpload up{layers[i], sc::PixelBuffer::filled(64, 32, 0.1f * i, 0, 0, 1)};
        while (!queue.submit(up)) std::this_thread::yield();
      }
    });

    std::vector<sc::CompletedUpload> all;
    while (static_cast<int>(all.size()) < kUploads) {
      for (sc::CompletedUpload& c : queue.drainInto(storage.uploader())) all.push_back(c);
      std::this_thread::yield();
    }
    producer.join();

    for (int i = 0; i < kUploads; i++) {
      requireTrue(all[i].layer == layers[i], "FIFO across threads");
      requireTrue(all[i].result.ok && all[i].result.tilesWritten == 2, "upload landed");
      requireTrue(!storage.index().get(sc::TileKey{layers[i], sc::TileCoord{1, 0}}).isSentinel(),
                  "tile resident");
    }
    requireTrue(storage.index().size() == kUploads * 2u, "two tiles per upload");
    requireTrue(dev.batchesSubmitted() == kUploads, "one batch per upload");
    std::printf("  Test 2 (producer thread) PASS\n");
  }

  std::printf("M3.2 upload_queue: ALL PASS\n");
  return 0;
}
