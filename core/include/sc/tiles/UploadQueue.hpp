#pragma once
#include "sc/data/ThreadSafeQueue.hpp"
#include "sc/image/PixelBuffer.hpp"
#include "sc/tiles/TileUploader.hpp"

#include <cstddef>
#include <vector>

namespace sc {

struct PendingUpload {
  LayerId layer{kSentinelLayerId};
  PixelBuffer pixels;
};

struct CompletedUpload {
  LayerId layer{kSentinelLayerId};
  UploadResult result;
};

// Hand-off from a background producer (e.g. a decoder thread) to the thread
// that owns the device. Once submitted an upload is never cancelled.
class UploadQueue {
public:
  explicit UploadQueue(std::size_t maxPending = 16);

  // Any thread. False if the queue is full; the caller keeps ownership.
  bool submit(PendingUpload& upload);

  // Device thread. Uploads everything queued so far, in submission order.
  std::vector<CompletedUpload> drainInto(TileUploader& uploader);

  std::size_t pending() const { return queue_.size(); }

private:
  ThreadSafeQueue<PendingUpload> queue_;
};

} // namespace sc
