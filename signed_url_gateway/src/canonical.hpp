#pragma once

#include "util.hpp"

#include <string>
#include <string_view>

namespace signing {

inline constexpr std::string_view kTokenParam = "token";
inline constexpr std::string_view kOptionsParam = "o";

// Parameters minus "token", sorted by name then value, percent-encoded.
std::string canonical_query(const util::QueryParams& params);

// Digest input for a URL: path + "?" + sorted, percent-encoded query.
// Every "token" parameter is left out, so a URL canonicalizes the same
// before and after it is signed.
std::string canonicalize(std::string_view path, const util::QueryParams& params);

} // namespace signing
