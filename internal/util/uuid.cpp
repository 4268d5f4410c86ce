#include "uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace ctxsync::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

void AppendHex(std::string& out, uint8_t byte) {
  out.push_back(kHex[byte >> 4]);
  out.push_back(kHex[byte & 0x0F]);
}

} // namespace

std::string GenerateUuid() {
  std::array<uint8_t, 16> bytes{};
  for (auto& b : bytes) b = static_cast<uint8_t>(Rng()());
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    AppendHex(out, bytes[i]);
  }
  return out;
}

std::string GenerateShortId(std::string_view prefix) {
  std::string id(prefix);
  id.reserve(prefix.size() + 8);
  const auto bits = static_cast<uint32_t>(Rng()());
  for (int shift = 28; shift >= 0; shift -= 4) id.push_back(kHex[(bits >> shift) & 0x0F]);
  return id;
}

} // namespace ctxsync::util
