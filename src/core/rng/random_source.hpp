#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <utility>
#include <span>
#include <vector>

namespace hogpen {

class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform integer in [0, bound). bound must be positive.
  virtual std::uint32_t uniform(std::uint32_t bound) = 0;
};

// Production source backed by libsodium's CSPRNG.
class SodiumRandomSource final : public RandomSource {
public:
  std::uint32_t uniform(std::uint32_t bound) override;
};

// Deterministic source for replays and tests.
class SeededRandomSource final : public RandomSource {
public:
  explicit SeededRandomSource(std::uint64_t seed) : gen_(seed) {}

  std::uint32_t uniform(std::uint32_t bound) override;

private:
  std::mutex mutex_;
  std::mt19937_64 gen_;
};

// Replays a fixed sequence (each value taken modulo the bound), then yields zeros.
class ScriptedRandomSource final : public RandomSource {
public:
  explicit ScriptedRandomSource(std::vector<std::uint32_t> values) : values_(std::move(values)) {}

  std::uint32_t uniform(std::uint32_t bound) override;
  [[nodiscard]] std::size_t consumed() const { return next_; }

private:
  std::vector<std::uint32_t> values_;
  std::size_t next_ = 0;
};

// Index into weights drawn proportionally to each weight.
std::size_t weighted_index(std::span<const std::uint32_t> weights, RandomSource& rng);

// Inclusive range [lo, hi].
std::int64_t uniform_between(std::int64_t lo, std::int64_t hi, RandomSource& rng);

}  // namespace hogpen
