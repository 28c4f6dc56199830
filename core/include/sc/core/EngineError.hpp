#pragma once
#include <string>

namespace sc {

// Error codes carried by EngineError::code.
inline constexpr const char* kErrOutOfDeviceMemory = "OUT_OF_DEVICE_MEMORY";
inline constexpr const char* kErrInvalidPixelBuffer = "INVALID_PIXEL_BUFFER";
inline constexpr const char* kErrInvalidLayer = "INVALID_LAYER";

struct EngineError {
  std::string code;     // one of the kErr* constants
  std::string message;  // human text
};

inline EngineError makeError(const char* code, const std::string& message) {
  return EngineError{code, message};
}

} // namespace sc
