#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace signing {

inline constexpr std::string_view kDescriptorParam = "eddfile";

// (payment, download, file key) packed into the "eddfile" parameter.
struct DownloadDescriptor {
  std::uint64_t payment_id = 0;
  std::uint64_t download_id = 0;
  std::string file_key;

  // "payment:download:file_key"
  std::string str() const;
};

bool operator==(const DownloadDescriptor& a, const DownloadDescriptor& b);

// File keys are limited to letters, digits and "-._~", so the wire form and
// the decoded form can never be confused with each other.
bool valid_file_key(std::string_view key);

// URL-encoded wire form, e.g. "42%3A7%3A3".
std::string encode_descriptor(const DownloadDescriptor& d);

// Parses the decoded "p:d:f" form, as a query parser hands it out. Exactly
// three parts are required: two non-negative decimal integers and a valid
// file key. On failure *err starts with "InvalidDescriptor".
std::optional<DownloadDescriptor> parse_descriptor(std::string_view decoded, std::string* err = nullptr);

// Percent-decodes the wire form once, then parse_descriptor().
std::optional<DownloadDescriptor> decode_descriptor(std::string_view in, std::string* err = nullptr);

} // namespace signing
