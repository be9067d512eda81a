#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util {

// Ordered query parameters, decoded. Duplicate names are allowed.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// %XX-decodes; std::nullopt on a truncated or non-hex escape. '+' is literal.
std::optional<std::string> percent_decode(std::string_view in);

// Keeps RFC 3986 unreserved characters, %XX (uppercase) for everything else,
// '/' included.
std::string percent_encode(std::string_view in);

// "a=b&c=d" -> {(a,b),(c,d)}. Empty pieces are skipped, a piece without '='
// has an empty value, and an undecodable piece is kept verbatim.
QueryParams parse_query(std::string_view query);

// Inverse of parse_query: encodes every name and value, keeps the order.
std::string encode_query(const QueryParams& params);

using Sha256Digest = std::array<std::uint8_t, 32>;

std::optional<Sha256Digest> hmac_sha256(std::string_view key, std::string_view data);

std::string hex_lower(const Sha256Digest& digest);

// Length is not secret; contents are compared in constant time.
bool constant_time_equal(std::string_view a, std::string_view b);

std::string base64_encode(std::string_view in);
std::optional<std::string> base64_decode(std::string_view in);

std::vector<std::string> split(std::string_view s, char delim);

} // namespace util
