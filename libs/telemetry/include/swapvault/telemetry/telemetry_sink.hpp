#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <vector>

namespace swapvault {
namespace telemetry {

enum class Metric : std::uint16_t {
  kDepositAccepted = 1,
  kDepositRejected = 2,
  kWithdrawalAccepted = 3,
  kWithdrawalRejected = 4,
  kAdminAccepted = 5,
  kAdminRejected = 6,
  kDepositLatency = 16,
  kWithdrawalLatency = 17,
};

struct Sample {
  Metric metric{Metric::kDepositAccepted};
  std::int64_t value{};
};

// Log2-bucketed latency histogram, 1ns to ~1s.
class LatencyHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_upper_bound(std::size_t idx) noexcept;
};

// Counter samples wait in a bounded buffer until drained; once it is full
// new samples only reach the running totals.
class TelemetrySink {
 public:
  static constexpr std::size_t kMaxBufferedSamples = 4096;

  void increment(Metric metric, std::int64_t delta = 1);
  void record_latency(Metric metric, std::chrono::nanoseconds latency);
  [[nodiscard]] std::vector<Sample> drain();

  struct Summary {
    Metric metric{Metric::kDepositLatency};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

  // Running sum of a counter since construction; drain() does not reset it.
  [[nodiscard]] std::int64_t total(Metric metric) const;

  // Samples turned away because the buffer was full.
  [[nodiscard]] std::uint64_t dropped() const;

 private:
  static constexpr std::size_t kMaxMetricId = 32;

  mutable std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::array<std::int64_t, kMaxMetricId> totals_{};
  std::uint64_t dropped_{0};
  std::array<LatencyHistogram, kMaxMetricId> histograms_{};

  static std::size_t slot(Metric metric) noexcept;
};

}  // namespace telemetry
}  // namespace swapvault
