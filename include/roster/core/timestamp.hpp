#pragma once
#include <chrono>
#include <cstdint>

namespace roster::core {

// Nanoseconds since the Unix epoch.
inline std::uint64_t nowNanos() {
  auto Since = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Since).count()
  );
}

} // namespace roster::core
