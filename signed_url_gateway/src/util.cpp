#include "util.hpp"

#include <charconv>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace util {

namespace {

constexpr char kHexUpper[] = "0123456789ABCDEF";
constexpr char kHexLower[] = "0123456789abcdef";

constexpr bool unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

std::optional<std::string> percent_decode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    if (in[i] != '%') {
      out.push_back(in[i++]);
      continue;
    }
    if (in.size() - i < 3) return std::nullopt;
    const char* first = in.data() + i + 1;
    const char* last = first + 2;
    unsigned int byte = 0;
    auto res = std::from_chars(first, last, byte, 16);
    if (res.ec != std::errc{} || res.ptr != last) return std::nullopt;
    out.push_back(static_cast<char>(byte));
    i += 3;
  }
  return out;
}

std::string percent_encode(std::string_view in) {
  std::string out;
  out.reserve(in.size() * 3);
  for (unsigned char c : in) {
    if (unreserved(c)) {
      out.push_back(static_cast<char>(c));
      continue;
    }
    out.push_back('%');
    out.push_back(kHexUpper[c >> 4]);
    out.push_back(kHexUpper[c & 0xF]);
  }
  return out;
}

QueryParams parse_query(std::string_view query) {
  QueryParams out;
  if (query.empty()) return out;
  for (const std::string& piece : split(query, '&')) {
    if (piece.empty()) continue;
    const size_t eq = piece.find('=');
    std::string name = piece.substr(0, eq);
    std::string value = (eq == std::string::npos) ? std::string() : piece.substr(eq + 1);
    auto dn = percent_decode(name);
    auto dv = percent_decode(value);
    out.emplace_back(dn ? std::move(*dn) : std::move(name), dv ? std::move(*dv) : std::move(value));
  }
  return out;
}

std::string encode_query(const QueryParams& params) {
  std::string out;
  for (const auto& kv : params) {
    if (!out.empty()) out.push_back('&');
    out += percent_encode(kv.first);
    out.push_back('=');
    out += percent_encode(kv.second);
  }
  return out;
}

std::optional<Sha256Digest> hmac_sha256(std::string_view key, std::string_view data) {
  Sha256Digest digest{};
  unsigned int len = 0;
  const unsigned char* ok = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                                 reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                                 digest.data(), &len);
  if (!ok || len != digest.size()) return std::nullopt;
  return digest;
}

std::string hex_lower(const Sha256Digest& digest) {
  std::string out;
  out.reserve(digest.size() * 2);
  for (std::uint8_t b : digest) {
    out.push_back(kHexLower[b >> 4]);
    out.push_back(kHexLower[b & 0xF]);
  }
  return out;
}

bool constant_time_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string base64_encode(std::string_view in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(in.data()),
                                static_cast<int>(in.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::optional<std::string> base64_decode(std::string_view in) {
  if (in.size() % 4 != 0) return std::nullopt;
  std::string out(in.size() / 4 * 3, '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(in.data()),
                                static_cast<int>(in.size()));
  if (n < 0) return std::nullopt;
  // EVP_DecodeBlock counts padding as zero bytes.
  size_t padding = 0;
  while (padding < 2 && padding < in.size() && in[in.size() - 1 - padding] == '=') ++padding;
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

std::vector<std::string> split(std::string_view s, char delim) {
  std::vector<std::string> out;
  for (;;) {
    const size_t pos = s.find(delim);
    out.emplace_back(s.substr(0, pos));
    if (pos == std::string_view::npos) break;
    s.remove_prefix(pos + 1);
  }
  return out;
}

} // namespace util
