#include "swapvault/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>
#include <utility>

namespace swapvault {
namespace telemetry {

std::size_t LatencyHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] holds values whose bit width is i
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t LatencyHistogram::bucket_upper_bound(std::size_t idx) noexcept {
  return (static_cast<std::int64_t>(1) << idx) - 1;
}

void LatencyHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void LatencyHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  max_ = 0;
}

double LatencyHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double LatencyHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  const auto target = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(static_cast<double>(count_) * p));
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(std::min(bucket_upper_bound(idx), max_));
    }
  }
  return static_cast<double>(max_);
}

std::size_t TelemetrySink::slot(Metric metric) noexcept {
  return static_cast<std::size_t>(metric) % kMaxMetricId;
}

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  totals_[slot(metric)] += delta;
  if (buffer_.size() >= kMaxBufferedSamples) {
    ++dropped_;
    return;
  }
  buffer_.push_back(Sample{.metric = metric, .value = delta});
}

std::uint64_t TelemetrySink::dropped() const {
  std::scoped_lock lock(mutex_);
  return dropped_;
}

void TelemetrySink::record_latency(Metric metric, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[slot(metric)].record(latency.count());
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;

  for (std::size_t idx = 0; idx < kMaxMetricId; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }
    summaries.push_back(Summary{
        .metric = static_cast<Metric>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });
    hist.reset();
  }

  return summaries;
}

std::int64_t TelemetrySink::total(Metric metric) const {
  std::scoped_lock lock(mutex_);
  return totals_[slot(metric)];
}

}  // namespace telemetry
}  // namespace swapvault
