// src/worldgen/Random.hpp
#pragma once
#include <cstdint>

namespace islandgen::worldgen {

// Minimal PCG32 RNG (O'Neill), XSH-RR output. 32-bit outputs, 64-bit state/stream.
//
// This is the reference stream of the heightmap pipeline: given the same seed and
// stream id, the draw sequence is identical on every platform. Changing anything in
// seed_rng/next/next_float01 changes every pinned fixture.
struct Pcg32 {
  using result_type = std::uint32_t;

  std::uint64_t state = 0x853c49e6748fea9bULL;
  std::uint64_t inc   = 0xda3e39cb94b95bdbULL; // must be odd

  Pcg32() = default;
  explicit Pcg32(std::uint64_t seed, std::uint64_t seq = 1u) noexcept { seed_rng(seed, seq); }

  // `seq` selects the stream; inc = (seq << 1) | 1 keeps it odd.
  void seed_rng(std::uint64_t seed, std::uint64_t seq = 1u) noexcept;

  result_type next() noexcept;

  // Top 24 bits scaled by 2^-24: exactly representable, always in [0,1).
  float next_float01() noexcept;

  friend bool operator==(const Pcg32& a, const Pcg32& b) noexcept {
    return a.state == b.state && a.inc == b.inc;
  }
  friend bool operator!=(const Pcg32& a, const Pcg32& b) noexcept { return !(a == b); }
};

// ASCII-packed tag "ISLANDS1": stream id of the pipeline's RandomStream (version 1).
inline constexpr std::uint64_t kPipelineStream = 0x49534C414E445331ull;

// SplitMix64 scrambler (good bit-mixer for seeds)
[[nodiscard]] inline std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// Derive a deterministic sub-RNG from a parent stream + salt without advancing the parent.
// Used to key draws per cell so that passes can run in any order.
[[nodiscard]] Pcg32 sub_rng(const Pcg32& parent, std::uint64_t salt) noexcept;

[[nodiscard]] inline Pcg32 sub_rng(const Pcg32& parent, int a, int b) noexcept {
  return sub_rng(parent, (static_cast<std::uint64_t>(static_cast<std::uint32_t>(a)) << 32) |
                           static_cast<std::uint32_t>(b));
}

} // namespace islandgen::worldgen
