#include "descriptor.hpp"
#include "util.hpp"

#include <cctype>
#include <charconv>
#include <vector>

namespace signing {

static bool parse_u64(std::string_view s, std::uint64_t* out) {
  if (s.empty()) return false;
  std::uint64_t val = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), val);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return false;
  *out = val;
  return true;
}

static std::optional<DownloadDescriptor> fail(std::string* err, const char* msg) {
  if (err) *err = std::string("InvalidDescriptor: ") + msg;
  return std::nullopt;
}

std::string DownloadDescriptor::str() const {
  std::string out = std::to_string(payment_id);
  out.push_back(':');
  out += std::to_string(download_id);
  out.push_back(':');
  out += file_key;
  return out;
}

bool operator==(const DownloadDescriptor& a, const DownloadDescriptor& b) {
  return a.payment_id == b.payment_id && a.download_id == b.download_id && a.file_key == b.file_key;
}

bool valid_file_key(std::string_view key) {
  if (key.empty()) return false;
  for (unsigned char c : key) {
    if (!std::isalnum(c) && c != '-' && c != '.' && c != '_' && c != '~') return false;
  }
  return true;
}

std::string encode_descriptor(const DownloadDescriptor& d) {
  return util::percent_encode(d.str());
}

std::optional<DownloadDescriptor> parse_descriptor(std::string_view decoded, std::string* err) {
  std::vector<std::string> parts = util::split(decoded, ':');
  if (parts.size() != 3) return fail(err, "expected payment:download:file_key");

  DownloadDescriptor d;
  if (!parse_u64(parts[0], &d.payment_id)) return fail(err, "payment id is not a non-negative integer");
  if (!parse_u64(parts[1], &d.download_id)) return fail(err, "download id is not a non-negative integer");
  if (parts[2].empty()) return fail(err, "empty file key");
  if (!valid_file_key(parts[2])) return fail(err, "file key has characters outside [A-Za-z0-9-._~]");
  d.file_key = std::move(parts[2]);
  return d;
}

std::optional<DownloadDescriptor> decode_descriptor(std::string_view in, std::string* err) {
  auto decoded = util::percent_decode(in);
  if (!decoded) return fail(err, "malformed percent-encoding");
  return parse_descriptor(*decoded, err);
}

} // namespace signing
