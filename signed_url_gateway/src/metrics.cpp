#include "metrics.hpp"

#include <cmath>
#include <sstream>

namespace server {

namespace {

std::uint64_t to_us(double ms) {
  return static_cast<std::uint64_t>(std::llround(ms * 1000.0));
}

} // namespace

Metrics::Metrics() {
  buckets_ms_ = {0.05, 0.1, 0.25, 0.5, 1, 2, 5, 10, 25, 50, 100, 250, 1000};
  for (auto& c : bucket_counts_) {
    c.store(0);
  }
}

void Metrics::IncInFlight() {
  inflight_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::DecInFlight() {
  inflight_.fetch_sub(1, std::memory_order_relaxed);
}

Metrics::MethodIndex Metrics::method_index(std::string_view method) {
  if (method == "GET") return kGet;
  if (method == "HEAD") return kHead;
  if (method == "POST") return kPost;
  return kOther;
}

const char* Metrics::method_name(MethodIndex idx) {
  switch (idx) {
    case kGet: return "GET";
    case kHead: return "HEAD";
    case kPost: return "POST";
    default: return "OTHER";
  }
}

void Metrics::Observe(std::string_view method,
                      unsigned status,
                      std::size_t req_bytes,
                      std::size_t resp_bytes,
                      double latency_ms) {
  MethodIndex idx = method_index(method);
  req_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  req_bytes_[idx].fetch_add(req_bytes, std::memory_order_relaxed);
  resp_bytes_[idx].fetch_add(resp_bytes, std::memory_order_relaxed);
  if (status >= 400) {
    err_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  }

  latency_count_.fetch_add(1, std::memory_order_relaxed);
  latency_sum_us_.fetch_add(to_us(latency_ms), std::memory_order_relaxed);

  for (std::size_t i = 0; i < buckets_ms_.size(); ++i) {
    if (latency_ms <= buckets_ms_[i]) {
      bucket_counts_[i].fetch_add(1, std::memory_order_relaxed);
      break;
    }
  }
}

void Metrics::ObserveSign(SignOutcome outcome) {
  sign_counts_[static_cast<std::size_t>(outcome)].fetch_add(1, std::memory_order_relaxed);
}

void Metrics::ObserveVerify(VerifyOutcome outcome) {
  verify_counts_[static_cast<std::size_t>(outcome)].fetch_add(1, std::memory_order_relaxed);
}

Metrics::RocksOpIndex Metrics::rocks_op_index(std::string_view op) {
  if (op == "get") return kRdbGet;
  if (op == "write") return kRdbWrite;
  return kRdbOther;
}

const char* Metrics::rocks_op_name(RocksOpIndex idx) {
  switch (idx) {
    case kRdbGet: return "get";
    case kRdbWrite: return "write";
    default: return "other";
  }
}

void Metrics::ObserveRocksdb(std::string_view op,
                             bool ok,
                             std::size_t bytes,
                             double latency_ms) {
  RocksOpIndex idx = rocks_op_index(op);
  rdb_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  rdb_bytes_[idx].fetch_add(bytes, std::memory_order_relaxed);
  if (!ok) {
    rdb_err_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  }
  rdb_latency_count_.fetch_add(1, std::memory_order_relaxed);
  rdb_latency_sum_us_.fetch_add(to_us(latency_ms), std::memory_order_relaxed);
}

std::string Metrics::RenderPrometheus() const {
  std::ostringstream oss;

  auto per_method = [&](const char* name, const char* help,
                        const std::array<std::atomic<std::uint64_t>, kMethodCount>& values) {
    oss << "# HELP " << name << " " << help << "\n";
    oss << "# TYPE " << name << " counter\n";
    for (int i = 0; i < kMethodCount; ++i) {
      oss << name << "{method=\"" << method_name(static_cast<MethodIndex>(i))
          << "\"} " << values[i].load() << "\n";
    }
  };

  per_method("surlgw_requests_total", "Total HTTP requests.", req_counts_);
  per_method("surlgw_request_errors_total", "HTTP requests with status >= 400.", err_counts_);
  per_method("surlgw_request_bytes_total", "Request body bytes.", req_bytes_);
  per_method("surlgw_response_bytes_total", "Response body bytes.", resp_bytes_);

  oss << "# HELP surlgw_inflight_requests In-flight HTTP requests.\n";
  oss << "# TYPE surlgw_inflight_requests gauge\n";
  oss << "surlgw_inflight_requests " << inflight_.load() << "\n";

  oss << "# HELP surlgw_request_latency_ms Request latency in milliseconds.\n";
  oss << "# TYPE surlgw_request_latency_ms histogram\n";
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < buckets_ms_.size(); ++i) {
    cumulative += bucket_counts_[i].load();
    oss << "surlgw_request_latency_ms_bucket{le=\"" << buckets_ms_[i] << "\"} "
        << cumulative << "\n";
  }
  std::uint64_t count = latency_count_.load();
  oss << "surlgw_request_latency_ms_bucket{le=\"+Inf\"} " << count << "\n";
  oss << "surlgw_request_latency_ms_sum " << static_cast<double>(latency_sum_us_.load()) / 1000.0 << "\n";
  oss << "surlgw_request_latency_ms_count " << count << "\n";

  oss << "# HELP surlgw_sign_total Download URL signing attempts.\n";
  oss << "# TYPE surlgw_sign_total counter\n";
  oss << "surlgw_sign_total{outcome=\"issued\"} " << sign_counts_[0].load() << "\n";
  oss << "surlgw_sign_total{outcome=\"skipped\"} " << sign_counts_[1].load() << "\n";
  oss << "surlgw_sign_total{outcome=\"error\"} " << sign_counts_[2].load() << "\n";

  oss << "# HELP surlgw_verify_total Signed download request checks.\n";
  oss << "# TYPE surlgw_verify_total counter\n";
  oss << "surlgw_verify_total{outcome=\"valid\"} " << verify_counts_[0].load() << "\n";
  oss << "surlgw_verify_total{outcome=\"invalid\"} " << verify_counts_[1].load() << "\n";
  oss << "surlgw_verify_total{outcome=\"not_applicable\"} " << verify_counts_[2].load() << "\n";
  oss << "surlgw_verify_total{outcome=\"error\"} " << verify_counts_[3].load() << "\n";

  oss << "# HELP surlgw_rocksdb_ops_total RocksDB operations.\n";
  oss << "# TYPE surlgw_rocksdb_ops_total counter\n";
  for (int i = 0; i < kRdbOpCount; ++i) {
    oss << "surlgw_rocksdb_ops_total{op=\"" << rocks_op_name(static_cast<RocksOpIndex>(i))
        << "\"} " << rdb_counts_[i].load() << "\n";
  }
  oss << "# HELP surlgw_rocksdb_errors_total RocksDB operations with non-OK status.\n";
  oss << "# TYPE surlgw_rocksdb_errors_total counter\n";
  for (int i = 0; i < kRdbOpCount; ++i) {
    oss << "surlgw_rocksdb_errors_total{op=\"" << rocks_op_name(static_cast<RocksOpIndex>(i))
        << "\"} " << rdb_err_counts_[i].load() << "\n";
  }
  oss << "# HELP surlgw_rocksdb_bytes_total RocksDB bytes read/written.\n";
  oss << "# TYPE surlgw_rocksdb_bytes_total counter\n";
  for (int i = 0; i < kRdbOpCount; ++i) {
    oss << "surlgw_rocksdb_bytes_total{op=\"" << rocks_op_name(static_cast<RocksOpIndex>(i))
        << "\"} " << rdb_bytes_[i].load() << "\n";
  }
  oss << "# HELP surlgw_rocksdb_latency_ms RocksDB operation latency in milliseconds.\n";
  oss << "# TYPE surlgw_rocksdb_latency_ms summary\n";
  oss << "surlgw_rocksdb_latency_ms_sum " << static_cast<double>(rdb_latency_sum_us_.load()) / 1000.0 << "\n";
  oss << "surlgw_rocksdb_latency_ms_count " << rdb_latency_count_.load() << "\n";

  return oss.str();
}

} // namespace server
