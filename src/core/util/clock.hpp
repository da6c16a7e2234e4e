#pragma once

#include <atomic>
#include <cstdint>

namespace hogpen::util {

// Unix seconds. Session ages are persisted, so the clock must survive restarts.
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual std::int64_t now() const = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] std::int64_t now() const override;
};

class ManualClock final : public Clock {
public:
  explicit ManualClock(std::int64_t start = 1700000000) : now_(start) {}

  [[nodiscard]] std::int64_t now() const override { return now_.load(); }
  void set(std::int64_t value) { now_.store(value); }
  void advance(std::int64_t seconds) { now_.fetch_add(seconds); }

private:
  std::atomic<std::int64_t> now_;
};

}  // namespace hogpen::util
