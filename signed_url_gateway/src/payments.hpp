#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include <rocksdb/db.h>

namespace server {
class Metrics;
} // namespace server

namespace storage {

struct PaymentRecord {
  std::uint64_t payment_id = 0;
  std::string email;
  std::string purchase_key;
};

// Lookups used by the download hooks. A miss is std::nullopt with *err left
// empty; a backend failure sets *err.
class PaymentStore {
public:
  virtual ~PaymentStore() = default;

  virtual std::optional<std::uint64_t> find_payment_id(std::string_view purchase_key,
                                                       std::string* err) const = 0;
  virtual std::optional<PaymentRecord> find_payment(std::uint64_t payment_id,
                                                    std::string* err) const = 0;
};

class RocksPaymentStore final : public PaymentStore {
public:
  explicit RocksPaymentStore(rocksdb::DB* db,
                             rocksdb::WriteOptions write_opts = rocksdb::WriteOptions{},
                             server::Metrics* metrics = nullptr);

  std::optional<std::uint64_t> find_payment_id(std::string_view purchase_key,
                                               std::string* err) const override;
  std::optional<PaymentRecord> find_payment(std::uint64_t payment_id,
                                            std::string* err) const override;

  // Inserts or replaces a payment and its purchase-key index entry.
  bool put_payment(const PaymentRecord& record, std::string* err);

  // Lines of "payment_id,email,purchase_key"; blank lines and '#' comments
  // are skipped. Returns the number of imported records, or -1 with *err set
  // (including the offending line number).
  long import_csv(std::istream& in, std::string* err);

private:
  rocksdb::DB* db_;
  rocksdb::WriteOptions wo_;
  server::Metrics* metrics_;
};

} // namespace storage
