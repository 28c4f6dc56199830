#include "sc/ids/Id.hpp"
#include <atomic>

namespace sc {

LayerId nextLayerId() {
  static std::atomic<LayerId> counter{kSentinelLayerId};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace sc
