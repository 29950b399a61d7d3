#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace picstash {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., allocations, collisions, deletes). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, sizes in bytes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., cache fill ratio, record count). */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

namespace internal {

inline void EmitCounter(const std::shared_ptr<MetricsSink>& sink,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (sink) sink->Counter(name, delta);
}

inline void EmitHistogram(const std::shared_ptr<MetricsSink>& sink,
                          std::string_view name,
                          uint64_t value) {
  if (sink) sink->Histogram(name, value);
}

inline void EmitGauge(const std::shared_ptr<MetricsSink>& sink,
                      std::string_view name,
                      double value) {
  if (sink) sink->Gauge(name, value);
}

}  // namespace internal

}  // namespace picstash
