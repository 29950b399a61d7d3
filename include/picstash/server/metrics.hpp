#pragma once

#include <picstash/observability.hpp>
#include <picstash/rocks_registry.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace picstash::server {

/**
 * Prometheus-compatible metrics sink.
 *
 * Collects counters, histograms, and gauges and exports them
 * in Prometheus text exposition format. Core metric names use dots
 * ("picstash.upload.calls"); they are exported with underscores.
 *
 * Histogram bucket bounds follow the unit suffix of the name: "_us"
 * (microseconds), "bytes", "attempts"; anything else uses millisecond
 * latency buckets.
 */
class PrometheusMetrics : public picstash::MetricsSink {
 public:
  PrometheusMetrics() = default;

  // MetricsSink interface
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /**
   * Record an HTTP request metric. `route` should be a route label from
   * RouteLabel(), not a raw path.
   */
  void RecordHttpRequest(const std::string& method,
                         const std::string& route,
                         int status_code,
                         double latency_ms);

 private:
  mutable std::mutex mu_;

  // Counters: name -> value
  std::unordered_map<std::string, uint64_t> counters_;

  // Histograms: name -> cumulative bucket counts; `bounds` points at one of
  // the static bucket layouts, the last count is +Inf.
  struct HistogramData {
    const std::vector<double>* bounds = nullptr;
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    double sum = 0.0;
  };
  std::unordered_map<std::string, HistogramData> histograms_;

  // Gauges: name -> value
  std::unordered_map<std::string, double> gauges_;

  // HTTP request metrics with labels
  struct HttpMetricKey {
    std::string method;
    std::string route;
    int status_code;

    bool operator==(const HttpMetricKey& other) const {
      return method == other.method && route == other.route &&
             status_code == other.status_code;
    }
  };

  struct HttpMetricKeyHash {
    size_t operator()(const HttpMetricKey& k) const {
      return std::hash<std::string>{}(k.method) ^
             (std::hash<std::string>{}(k.route) << 1) ^
             (std::hash<int>{}(k.status_code) << 2);
    }
  };

  std::unordered_map<HttpMetricKey, uint64_t, HttpMetricKeyHash> http_requests_;
  HistogramData http_latency_;
};

/**
 * Collapse a request path to its route pattern ("/images/ab12Cd.png" ->
 * "/images/{filename}") so metric labels stay bounded.
 */
std::string RouteLabel(std::string_view path);

/**
 * Register the Prometheus endpoint with the Drogon app.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path,
                            RocksRegistry* registry);

/**
 * Count every response: the persistent per-status-code counter in the
 * registry, and (if `metrics` is set) the labelled request counter and
 * latency histogram.
 */
void RegisterRequestAccounting(Registry* registry,
                               std::shared_ptr<PrometheusMetrics> metrics);

}  // namespace picstash::server
