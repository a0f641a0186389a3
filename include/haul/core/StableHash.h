#pragma once

#include "haul/core/Types.h"

#include <cmath>
#include <cstddef>
#include <cstring>
#include <string_view>

namespace haul::core {

// Portable 64-bit FNV-1a hash builder for regression signatures.
//
// Integers are fed in little-endian order and strings are length-prefixed, so a
// signature is the same on every platform. Not cryptographic.
class StableHash64 {
public:
  static constexpr u64 kOffsetBasis = 14695981039346656037ull;
  static constexpr u64 kPrime       = 1099511628211ull;

  explicit StableHash64(u64 seed = kOffsetBasis) : h_(seed) {}

  u64 value() const { return h_; }

  void addByte(u8 b) {
    h_ ^= static_cast<u64>(b);
    h_ *= kPrime;
  }

  void addBytes(const void* data, std::size_t size) {
    if (!data || size == 0) return;
    const auto* p = static_cast<const u8*>(data);
    for (std::size_t i = 0; i < size; ++i) addByte(p[i]);
  }

  void addBool(bool v) { addByte(v ? 1u : 0u); }

  void addU64(u64 v) {
    for (int shift = 0; shift < 64; shift += 8) {
      addByte(static_cast<u8>((v >> shift) & 0xFFull));
    }
  }

  void addSize(std::size_t v) { addU64(static_cast<u64>(v)); }

  void addString(std::string_view s) {
    addU64(static_cast<u64>(s.size()));
    addBytes(s.data(), s.size());
  }

  // Exact IEEE-754 bits; use when results must be bitwise identical.
  void addDoubleBits(double v) {
    static_assert(sizeof(double) == sizeof(u64), "double must be 64-bit");
    u64 bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    addU64(bits);
  }

  // Quantized (default 1e-6 units); tolerant of last-bit differences.
  void addDoubleQ(double v, double scale = 1e6) {
    if (!std::isfinite(v) || !std::isfinite(scale) || scale <= 0.0) {
      addByte(0xFFu);
      return;
    }
    addU64(static_cast<u64>(static_cast<i64>(std::llround(v * scale))));
  }

private:
  u64 h_{kOffsetBasis};
};

} // namespace haul::core
