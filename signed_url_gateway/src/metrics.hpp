#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace server {

class Metrics {
public:
  enum class SignOutcome {
    Issued = 0,   // signed URL handed out
    Skipped = 1,  // args returned unsigned (missing key, lookup miss, no secret)
    Error = 2,    // payment store failure
  };

  enum class VerifyOutcome {
    Valid = 0,
    Invalid = 1,
    NotApplicable = 2,
    Error = 3,  // payment store failure; not a rejected token
  };

  Metrics();

  void IncInFlight();
  void DecInFlight();

  void Observe(std::string_view method,
               unsigned status,
               std::size_t req_bytes,
               std::size_t resp_bytes,
               double latency_ms);

  void ObserveSign(SignOutcome outcome);
  void ObserveVerify(VerifyOutcome outcome);

  void ObserveRocksdb(std::string_view op,
                      bool ok,
                      std::size_t bytes,
                      double latency_ms);

  std::string RenderPrometheus() const;

private:
  enum MethodIndex {
    kGet = 0,
    kHead = 1,
    kPost = 2,
    kOther = 3,
    kMethodCount = 4,
  };

  static MethodIndex method_index(std::string_view method);
  static const char* method_name(MethodIndex idx);

  static constexpr std::size_t kBucketCount = 13;

  std::array<std::atomic<std::uint64_t>, kMethodCount> req_counts_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> err_counts_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> req_bytes_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> resp_bytes_{};

  std::atomic<std::uint64_t> latency_count_{0};
  std::atomic<std::uint64_t> latency_sum_us_{0};
  std::array<double, kBucketCount> buckets_ms_{};
  std::array<std::atomic<std::uint64_t>, kBucketCount> bucket_counts_{};

  std::atomic<std::int64_t> inflight_{0};

  std::array<std::atomic<std::uint64_t>, 3> sign_counts_{};
  std::array<std::atomic<std::uint64_t>, 4> verify_counts_{};

  enum RocksOpIndex {
    kRdbGet = 0,
    kRdbWrite = 1,
    kRdbOther = 2,
    kRdbOpCount = 3,
  };

  static RocksOpIndex rocks_op_index(std::string_view op);
  static const char* rocks_op_name(RocksOpIndex idx);

  std::array<std::atomic<std::uint64_t>, kRdbOpCount> rdb_counts_{};
  std::array<std::atomic<std::uint64_t>, kRdbOpCount> rdb_err_counts_{};
  std::array<std::atomic<std::uint64_t>, kRdbOpCount> rdb_bytes_{};
  std::atomic<std::uint64_t> rdb_latency_count_{0};
  std::atomic<std::uint64_t> rdb_latency_sum_us_{0};
};

} // namespace server
