#include "payments.hpp"
#include "metrics.hpp"
#include "util.hpp"

#include <rocksdb/write_batch.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace storage {

namespace {

using Clock = std::chrono::steady_clock;

void observe_rocksdb(server::Metrics* metrics,
                     std::string_view op,
                     const rocksdb::Status& st,
                     std::size_t bytes,
                     Clock::time_point start) {
  if (!metrics) return;
  auto end = Clock::now();
  double ms = std::chrono::duration<double, std::milli>(end - start).count();
  bool ok = st.ok() || st.IsNotFound();
  metrics->ObserveRocksdb(op, ok, bytes, ms);
}

} // namespace

static bool contains_nul(std::string_view s) {
  return s.find('\0') != std::string_view::npos;
}

static bool parse_u64(std::string_view s, std::uint64_t* out) {
  if (s.empty()) return false;
  std::uint64_t val = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), val);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return false;
  *out = val;
  return true;
}

static std::string payment_key(std::uint64_t payment_id) {
  std::string k;
  k.push_back('P');
  k.push_back('\0');
  k += std::to_string(payment_id);
  return k;
}

static std::string purchase_key_index(std::string_view purchase_key) {
  std::string k;
  k.reserve(2 + purchase_key.size());
  k.push_back('K');
  k.push_back('\0');
  k.append(purchase_key.data(), purchase_key.size());
  return k;
}

static std::string encode_record(const PaymentRecord& r) {
  // email\0purchase_key
  std::string out;
  out.reserve(1 + r.email.size() + r.purchase_key.size());
  out += r.email;
  out.push_back('\0');
  out += r.purchase_key;
  return out;
}

static std::optional<PaymentRecord> decode_record(std::uint64_t payment_id, std::string_view v) {
  size_t p = v.find('\0');
  if (p == std::string_view::npos) return std::nullopt;
  PaymentRecord r;
  r.payment_id = payment_id;
  r.email = std::string(v.substr(0, p));
  r.purchase_key = std::string(v.substr(p + 1));
  return r;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

RocksPaymentStore::RocksPaymentStore(rocksdb::DB* db,
                                     rocksdb::WriteOptions write_opts,
                                     server::Metrics* metrics)
    : db_(db), wo_(write_opts), metrics_(metrics) {}

std::optional<std::uint64_t> RocksPaymentStore::find_payment_id(std::string_view purchase_key,
                                                                std::string* err) const {
  if (purchase_key.empty() || contains_nul(purchase_key)) return std::nullopt;

  std::string value;
  auto start = Clock::now();
  auto st = db_->Get(rocksdb::ReadOptions{}, purchase_key_index(purchase_key), &value);
  observe_rocksdb(metrics_, "get", st, value.size(), start);
  if (st.IsNotFound()) return std::nullopt;
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return std::nullopt;
  }

  std::uint64_t id = 0;
  if (!parse_u64(value, &id)) {
    if (err) *err = "Corrupt purchase key index entry";
    return std::nullopt;
  }
  return id;
}

std::optional<PaymentRecord> RocksPaymentStore::find_payment(std::uint64_t payment_id,
                                                             std::string* err) const {
  std::string value;
  auto start = Clock::now();
  auto st = db_->Get(rocksdb::ReadOptions{}, payment_key(payment_id), &value);
  observe_rocksdb(metrics_, "get", st, value.size(), start);
  if (st.IsNotFound()) return std::nullopt;
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return std::nullopt;
  }

  auto rec = decode_record(payment_id, value);
  if (!rec && err) *err = "Corrupt payment record";
  return rec;
}

bool RocksPaymentStore::put_payment(const PaymentRecord& record, std::string* err) {
  if (record.purchase_key.empty()) {
    if (err) *err = "Invalid purchase key";
    return false;
  }
  if (contains_nul(record.purchase_key) || contains_nul(record.email)) {
    if (err) *err = "Invalid payment record";
    return false;
  }

  std::string lookup_err;
  auto previous = find_payment(record.payment_id, &lookup_err);
  if (!lookup_err.empty()) {
    if (err) *err = lookup_err;
    return false;
  }

  rocksdb::WriteBatch batch;
  if (previous && previous->purchase_key != record.purchase_key) {
    batch.Delete(purchase_key_index(previous->purchase_key));
  }
  const std::string value = encode_record(record);
  batch.Put(payment_key(record.payment_id), value);
  batch.Put(purchase_key_index(record.purchase_key), std::to_string(record.payment_id));

  auto start = Clock::now();
  auto st = db_->Write(wo_, &batch);
  observe_rocksdb(metrics_, "write", st, value.size(), start);
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }
  return true;
}

long RocksPaymentStore::import_csv(std::istream& in, std::string* err) {
  long imported = 0;
  long line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    std::string_view l = trim(line);
    if (l.empty() || l.front() == '#') continue;

    std::vector<std::string> cols = util::split(l, ',');
    PaymentRecord rec;
    if (cols.size() != 3 || !parse_u64(trim(cols[0]), &rec.payment_id)) {
      if (err) *err = "Invalid payment CSV at line " + std::to_string(line_no);
      return -1;
    }
    rec.email = std::string(trim(cols[1]));
    rec.purchase_key = std::string(trim(cols[2]));

    std::string put_err;
    if (!put_payment(rec, &put_err)) {
      if (err) *err = put_err + " at line " + std::to_string(line_no);
      return -1;
    }
    ++imported;
  }
  return imported;
}

} // namespace storage
