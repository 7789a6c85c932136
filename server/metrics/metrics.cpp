#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace guardway {

namespace {
MetricsRegistry g_metrics;

void RenderLabelledCounter(std::ostringstream &out, const std::string &name,
                           const std::string &help, const std::string &service,
                           const std::string &label,
                           const std::map<std::string, uint64_t> &values) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " counter\n";
  for (const auto &[key, value] : values) {
    out << name << "{service=\"" << service << "\"," << label << "=\"" << key
        << "\"} " << value << "\n";
  }
}
}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetService(const std::string& service) {
  std::lock_guard<std::mutex> lock(service_mutex_);
  service_ = service;
}

void MetricsRegistry::RecordRequestOutcome(const std::string& outcome) {
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++outcomes_[outcome];
}

void MetricsRegistry::RecordLatency(double ms) { request_latency_.Record(ms); }

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRedaction() {
  redacted_requests_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordInjection(const std::string& signature) {
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++injections_[signature];
}

void MetricsRegistry::RecordRedactorFallback() {
  redactor_fallbacks_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordUpstreamAttempts(int attempts) {
  if (attempts <= 0) {
    return;
  }
  upstream_attempts_.fetch_add(static_cast<uint64_t>(attempts), std::memory_order_relaxed);
  upstream_retries_.fetch_add(static_cast<uint64_t>(attempts - 1), std::memory_order_relaxed);
}

void MetricsRegistry::RecordUpstreamFailure(const std::string& reason) {
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++upstream_failures_[reason];
}

void MetricsRegistry::RecordTokenEstimates(int prompt_tokens, int completion_tokens) {
  if (prompt_tokens > 0) {
    prompt_tokens_.fetch_add(static_cast<uint64_t>(prompt_tokens), std::memory_order_relaxed);
  }
  if (completion_tokens > 0) {
    completion_tokens_.fetch_add(static_cast<uint64_t>(completion_tokens),
                                 std::memory_order_relaxed);
  }
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::string service;
  {
    std::lock_guard<std::mutex> lock(service_mutex_);
    service = service_;
  }
  std::map<std::string, uint64_t> outcomes;
  std::map<std::string, uint64_t> injections;
  std::map<std::string, uint64_t> upstream_failures;
  {
    std::lock_guard<std::mutex> lock(labelled_mutex_);
    outcomes = outcomes_;
    injections = injections_;
    upstream_failures = upstream_failures_;
  }
  std::ostringstream out;

  // --- Counters ---
  RenderLabelledCounter(out, "guardway_requests_total",
                        "Inbound chat completion requests by terminal outcome",
                        service, "outcome", outcomes);

  out << "# HELP guardway_redacted_requests_total Requests with at least one PII redaction\n";
  out << "# TYPE guardway_redacted_requests_total counter\n";
  out << "guardway_redacted_requests_total{service=\"" << service << "\"} "
      << redacted_requests_.load() << "\n";

  RenderLabelledCounter(out, "guardway_injection_detections_total",
                        "Prompt injection signature hits", service, "signature",
                        injections);

  out << "# HELP guardway_redactor_fallbacks_total Delegated redactor failures served by the pattern redactor\n";
  out << "# TYPE guardway_redactor_fallbacks_total counter\n";
  out << "guardway_redactor_fallbacks_total{service=\"" << service << "\"} "
      << redactor_fallbacks_.load() << "\n";

  out << "# HELP guardway_upstream_attempts_total HTTP attempts made against the upstream provider\n";
  out << "# TYPE guardway_upstream_attempts_total counter\n";
  out << "guardway_upstream_attempts_total{service=\"" << service << "\"} "
      << upstream_attempts_.load() << "\n";

  out << "# HELP guardway_upstream_retries_total Upstream attempts beyond the first\n";
  out << "# TYPE guardway_upstream_retries_total counter\n";
  out << "guardway_upstream_retries_total{service=\"" << service << "\"} "
      << upstream_retries_.load() << "\n";

  RenderLabelledCounter(out, "guardway_upstream_failures_total",
                        "Dispatches that ended without a usable upstream response",
                        service, "reason", upstream_failures);

  out << "# HELP guardway_prompt_tokens_estimated_total Estimated prompt tokens forwarded upstream\n";
  out << "# TYPE guardway_prompt_tokens_estimated_total counter\n";
  out << "guardway_prompt_tokens_estimated_total{service=\"" << service << "\"} "
      << prompt_tokens_.load() << "\n";

  out << "# HELP guardway_completion_tokens_estimated_total Estimated completion tokens returned\n";
  out << "# TYPE guardway_completion_tokens_estimated_total counter\n";
  out << "guardway_completion_tokens_estimated_total{service=\"" << service << "\"} "
      << completion_tokens_.load() << "\n";

  // --- Gauges ---
  out << "# HELP guardway_active_connections Connections currently being served\n";
  out << "# TYPE guardway_active_connections gauge\n";
  out << "guardway_active_connections{service=\"" << service << "\"} "
      << active_connections_.load() << "\n";

  // --- Request latency histogram ---
  out << "# HELP guardway_request_duration_ms Request end-to-end latency in milliseconds\n";
  out << "# TYPE guardway_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "guardway_request_duration_ms_bucket{service=\"" << service
        << "\",le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "guardway_request_duration_ms_bucket{service=\"" << service
      << "\",le=\"+Inf\"} " << request_latency_.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << "guardway_request_duration_ms_sum{service=\"" << service << "\"} "
      << request_latency_.sum_ms.load() << "\n";
  out << "guardway_request_duration_ms_count{service=\"" << service << "\"} "
      << request_latency_.total.load() << "\n";

  return out.str();
}

MetricsRegistry& GlobalMetrics() { return g_metrics; }

}  // namespace guardway
