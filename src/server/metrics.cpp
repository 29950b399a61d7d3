#include <picstash/server/metrics.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <iomanip>
#include <sstream>

namespace picstash::server {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

const std::vector<double> kMicrosBuckets = {
    50, 100, 250, 500, 1000, 2500, 5000, 10000, 25000, 50000,
    100000, 250000, 500000, 1000000, 2500000, 10000000};

// Upload sizes: 1 KiB to 64 MiB.
const std::vector<double> kBytesBuckets = {
    1024, 4096, 16384, 65536, 262144, 1048576, 4194304, 16777216, 67108864};

// Claim attempts per allocation.
const std::vector<double> kAttemptBuckets = {1, 2, 3, 4, 5, 6, 8, 10, 16};

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

const std::vector<double>& BucketsFor(std::string_view name) {
  if (EndsWith(name, "_us")) return kMicrosBuckets;
  if (EndsWith(name, "bytes")) return kBytesBuckets;
  if (EndsWith(name, "attempts")) return kAttemptBuckets;
  return kLatencyBuckets;
}

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

void Observe(std::vector<uint64_t>* buckets, const std::vector<double>& bounds, double value) {
  if (buckets->empty()) {
    buckets->resize(bounds.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, bounds);
  for (size_t i = bucket; i < buckets->size(); ++i) {
    (*buckets)[i]++;
  }
}

// Prometheus names are [a-zA-Z_:][a-zA-Z0-9_:]*.
std::string MetricName(std::string_view name) {
  std::string out(name);
  for (char& c : out) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == ':';
    if (!ok) c = '_';
  }
  return out;
}

}  // namespace

// --- PrometheusMetrics ---

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[MetricName(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& h = histograms_[MetricName(name)];
  if (!h.bounds) h.bounds = &BucketsFor(name);
  Observe(&h.buckets, *h.bounds, static_cast<double>(value));
  h.count++;
  h.sum += static_cast<double>(value);
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[MetricName(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& route,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);

  HttpMetricKey key{method, route, status_code};
  http_requests_[key]++;

  Observe(&http_latency_.buckets, kLatencyBuckets, latency_ms);
  http_latency_.count++;
  http_latency_.sum += latency_ms;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  // Export counters
  for (const auto& [name, value] : counters_) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  // Export gauges
  for (const auto& [name, value] : gauges_) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  // Export histograms
  for (const auto& [name, data] : histograms_) {
    out << "# TYPE " << name << " histogram\n";
    const auto& bounds = *data.bounds;
    for (size_t i = 0; i < bounds.size(); ++i) {
      out << name << "_bucket{le=\"" << bounds[i] << "\"} " << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  if (!http_requests_.empty()) {
    out << "# TYPE picstash_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "picstash_http_requests_total{method=\"" << key.method
          << "\",route=\"" << key.route << "\",status=\"" << key.status_code
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    out << "# TYPE picstash_http_request_duration_ms histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << "picstash_http_request_duration_ms_bucket{le=\""
          << kLatencyBuckets[i] << "\"} " << http_latency_.buckets[i] << "\n";
    }
    out << "picstash_http_request_duration_ms_bucket{le=\"+Inf\"} "
        << http_latency_.buckets.back() << "\n";
    out << "picstash_http_request_duration_ms_sum " << http_latency_.sum << "\n";
    out << "picstash_http_request_duration_ms_count " << http_latency_.count << "\n";
  }

  return out.str();
}

std::string RouteLabel(std::string_view path) {
  struct Prefix {
    std::string_view prefix;
    std::string_view label;
  };
  static constexpr Prefix kDynamic[] = {
      {"/api/images/", "/api/images/{id}"},
      {"/images/", "/images/{filename}"},
      {"/source/", "/source/{id}"},
  };
  static constexpr std::string_view kStatic[] = {
      "/api/upload", "/api/sources", "/api/images", "/api/metrics",
      "/api/admin/sweep", "/health", "/health/ready", "/metrics",
  };

  for (const auto& p : kDynamic) {
    if (path.size() > p.prefix.size() && path.substr(0, p.prefix.size()) == p.prefix) {
      return std::string(p.label);
    }
  }
  for (const auto& s : kStatic) {
    if (path == s) return std::string(s);
  }
  return "other";
}

// --- Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path,
                            RocksRegistry* registry) {
  drogon::app().registerHandler(
      path,
      [metrics, registry](const drogon::HttpRequestPtr& req,
                          std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        if (registry) {
          registry->EmitCacheMetrics();
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

void RegisterRequestAccounting(Registry* registry,
                               std::shared_ptr<PrometheusMetrics> metrics) {
  drogon::app().registerPostHandlingAdvice(
      [registry, metrics](const drogon::HttpRequestPtr& req,
                          const drogon::HttpResponsePtr& resp) {
        const int code = static_cast<int>(resp->statusCode());

        if (registry) {
          Status s = registry->IncrementStatusCount(code);
          if (!s.ok()) {
            LOG_WARN << "Could not count status " << code << ": " << s.ToString();
          }
        }

        if (metrics) {
          const int64_t start_us = req->creationDate().microSecondsSinceEpoch();
          const int64_t end_us = trantor::Date::now().microSecondsSinceEpoch();
          const double latency_ms =
              end_us > start_us ? static_cast<double>(end_us - start_us) / 1000.0 : 0.0;
          metrics->RecordHttpRequest(std::string(req->methodString()),
                                     RouteLabel(req->path()), code, latency_ms);
        }
      });
}

}  // namespace picstash::server
