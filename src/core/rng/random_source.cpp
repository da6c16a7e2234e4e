#include "core/rng/random_source.hpp"

#include <numeric>

#include <sodium.h>

namespace hogpen {

std::uint32_t SodiumRandomSource::uniform(std::uint32_t bound) {
  if (bound <= 1) {
    return 0;
  }
  return randombytes_uniform(bound);
}

std::uint32_t SeededRandomSource::uniform(std::uint32_t bound) {
  if (bound <= 1) {
    return 0;
  }
  std::lock_guard lock{mutex_};
  std::uniform_int_distribution<std::uint32_t> dist(0, bound - 1U);
  return dist(gen_);
}

std::uint32_t ScriptedRandomSource::uniform(std::uint32_t bound) {
  if (bound <= 1 || next_ >= values_.size()) {
    return 0;
  }
  return values_[next_++] % bound;
}

std::size_t weighted_index(std::span<const std::uint32_t> weights, RandomSource& rng) {
  const std::uint32_t total = std::accumulate(weights.begin(), weights.end(), std::uint32_t{0});
  if (total == 0) {
    return 0;
  }

  std::uint32_t roll = rng.uniform(total);
  for (std::size_t i = 0; i < weights.size(); ++i) {
    if (roll < weights[i]) {
      return i;
    }
    roll -= weights[i];
  }
  return weights.size() - 1U;
}

std::int64_t uniform_between(std::int64_t lo, std::int64_t hi, RandomSource& rng) {
  if (hi <= lo) {
    return lo;
  }
  return lo + static_cast<std::int64_t>(rng.uniform(static_cast<std::uint32_t>(hi - lo + 1)));
}

}  // namespace hogpen
