#pragma once

#include "util.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace util {

struct ParsedUrl {
  std::string base;  // everything before '?', fragment dropped
  std::string path;  // includes leading '/'
  std::string query; // without '?'
  bool has_query = false;
};

// Accepts absolute URLs ("https://host/p?q") and origin-form targets ("/p?q").
ParsedUrl parse_url(std::string_view url);

// base + "?" + encode_query(params), or just base when params is empty.
std::string with_query(std::string_view base, const QueryParams& params);

std::optional<std::string> query_get(const QueryParams& q, std::string_view k);

// Replaces the first entry named k in place and drops later duplicates;
// appends when k is absent.
void query_set(QueryParams* q, std::string_view k, std::string v);

void query_remove(QueryParams* q, std::string_view k);

} // namespace util
