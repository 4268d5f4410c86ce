#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ctxsync::model {

// Ordered fastest first; promotion moves entries towards kL1.
enum class CacheTier : std::uint8_t {
  kL1 = 0,
  kL2 = 1,
  kL3 = 2,
};

inline constexpr std::size_t kCacheTierCount = 3;

constexpr std::string_view ToString(CacheTier tier) {
  switch (tier) {
    case CacheTier::kL1:
      return "l1";
    case CacheTier::kL2:
      return "l2";
    case CacheTier::kL3:
    default:
      return "l3";
  }
}

constexpr std::size_t Index(CacheTier tier) {
  return static_cast<std::size_t>(tier);
}

constexpr bool IsFasterOrEqual(CacheTier lhs, CacheTier rhs) {
  return static_cast<std::uint8_t>(lhs) <= static_cast<std::uint8_t>(rhs);
}

} // namespace ctxsync::model
