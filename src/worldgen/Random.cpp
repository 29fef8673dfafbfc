// src/worldgen/Random.cpp
#include "worldgen/Random.hpp"

namespace islandgen::worldgen {

void Pcg32::seed_rng(std::uint64_t seed, std::uint64_t seq) noexcept {
  state = 0u;
  inc   = (seq << 1u) | 1u;    // force odd
  next();                      // transition once
  state += seed;
  next();
}

Pcg32::result_type Pcg32::next() noexcept {
  const std::uint64_t old = state;
  // LCG step
  state = old * 6364136223846793005ULL + inc;

  // Output function (xorshift; rotr)
  const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
  const std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
  return (xorshifted >> rot) | (xorshifted << ((-static_cast<std::int32_t>(rot)) & 31));
}

float Pcg32::next_float01() noexcept {
  // 2^-24 = 1 / 16,777,216
  return static_cast<float>(next() >> 8) * (1.0f / 16777216.0f);
}

Pcg32 sub_rng(const Pcg32& parent, std::uint64_t salt) noexcept {
  // Mix both the parent's state and stream with the salt to form new seed/seq.
  const std::uint64_t seed = splitmix64(parent.state ^ (salt + 0x9E3779B97F4A7C15ULL));
  const std::uint64_t seq  = splitmix64(parent.inc   ^ (salt ^ 0xBF58476D1CE4E5B9ULL));
  Pcg32 child;
  child.seed_rng(seed, seq);
  return child;
}

} // namespace islandgen::worldgen
