#include "sc/tiles/UploadQueue.hpp"

#include <cstdio>
#include <utility>

namespace sc {

UploadQueue::UploadQueue(std::size_t maxPending) : queue_(maxPending) {}

bool UploadQueue::submit(PendingUpload& upload) {
  if (queue_.push(std::move(upload))) return true;
  std::fprintf(stderr, "UploadQueue: queue full, upload for layer %llu refused\n",
               static_cast<unsigned long long>(upload.layer));
  return false;
}

std::vector<CompletedUpload> UploadQueue::drainInto(TileUploader& uploader) {
  std::vector<CompletedUpload> done;
  for (PendingUpload& p : queue_.popAll()) {
    CompletedUpload c;
    c.layer = p.layer;
    c.result = uploader.upload(p.layer, p.pixels);
    done.push_back(std::move(c));
  }
  return done;
}

} // namespace sc
