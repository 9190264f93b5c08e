#include <catalog/server/metrics.hpp>

#include <drogon/drogon.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace catalog::server {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

// Prometheus metric names allow [a-zA-Z0-9_:] only.
std::string MetricName(std::string_view name) {
  std::string out(name);
  std::replace_if(
      out.begin(), out.end(),
      [](char c) {
        return !(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':');
      },
      '_');
  return out;
}

template <typename Data>
void Observe(Data* h, double value) {
  if (h->buckets.empty()) {
    h->buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, kLatencyBuckets);
  for (size_t i = bucket; i < h->buckets.size(); ++i) {
    h->buckets[i]++;
  }
  h->count++;
  h->sum += value;
}

template <typename Data>
void WriteHistogram(std::ostringstream& out, const std::string& name, const Data& data) {
  out << "# TYPE " << name << " histogram\n";
  for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << kLatencyBuckets[i] << "\"} "
        << data.buckets[i] << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
  out << name << "_sum " << data.sum << "\n";
  out << name << "_count " << data.count << "\n";
}

}  // namespace

// --- PrometheusMetrics ---

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[MetricName(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  Observe(&histograms_[MetricName(name)], static_cast<double>(value));
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[MetricName(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);

  HttpMetricKey key{method, path, status_code};
  http_requests_[key]++;

  Observe(&http_latency_, latency_ms);
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  for (const auto& [name, value] : counters_) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, value] : gauges_) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, data] : histograms_) {
    WriteHistogram(out, name, data);
  }

  if (!http_requests_.empty()) {
    out << "# TYPE catalog_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "catalog_http_requests_total{method=\"" << key.method
          << "\",path=\"" << key.path << "\",status=\"" << key.status_code
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    WriteHistogram(out, "catalog_http_request_duration_ms", http_latency_);
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const ProductStore* store,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics, store](const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        if (store) {
          metrics->Gauge("catalog.store.products", static_cast<double>(store->Size()));
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    metrics_->RecordHttpRequest(method_, path_, status_code_, ElapsedMs());
  }
}

double RequestTimer::ElapsedMs() const {
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_);
  return static_cast<double>(duration.count()) / 1000.0;
}

}  // namespace catalog::server
