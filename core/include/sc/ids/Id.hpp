#pragma once
#include <cstdint>

namespace sc {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Names one image layer. Opaque and immutable once handed out.
using LayerId = Id;

// Reserved for the empty tile; never returned by nextLayerId().
inline constexpr LayerId kSentinelLayerId = kInvalidId;

// Process-wide monotonically increasing layer ids, safe from any thread.
LayerId nextLayerId();

} // namespace sc
