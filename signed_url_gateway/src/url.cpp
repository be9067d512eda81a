#include "url.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace util {

ParsedUrl parse_url(std::string_view url) {
  ParsedUrl pu;
  size_t hash = url.find('#');
  if (hash != std::string_view::npos) url = url.substr(0, hash);

  size_t q = url.find('?');
  std::string_view base = (q == std::string_view::npos) ? url : url.substr(0, q);
  if (q != std::string_view::npos) {
    pu.query = std::string(url.substr(q + 1));
    pu.has_query = true;
  }
  pu.base = std::string(base);

  std::string_view path = base;
  size_t scheme = base.find("://");
  if (scheme != std::string_view::npos) {
    size_t slash = base.find('/', scheme + 3);
    path = (slash == std::string_view::npos) ? std::string_view{} : base.substr(slash);
  }
  pu.path = path.empty() ? "/" : std::string(path);
  return pu;
}

std::string with_query(std::string_view base, const QueryParams& params) {
  std::string out(base);
  if (params.empty()) return out;
  out.push_back('?');
  out += encode_query(params);
  return out;
}

std::optional<std::string> query_get(const QueryParams& q, std::string_view k) {
  for (const auto& kv : q) {
    if (kv.first == k) return kv.second;
  }
  return std::nullopt;
}

void query_set(QueryParams* q, std::string_view k, std::string v) {
  auto it = std::find_if(q->begin(), q->end(), [k](const auto& kv) { return kv.first == k; });
  if (it == q->end()) {
    q->emplace_back(std::string(k), std::move(v));
    return;
  }
  it->second = std::move(v);
  auto tail = std::remove_if(std::next(it), q->end(), [k](const auto& kv) { return kv.first == k; });
  q->erase(tail, q->end());
}

void query_remove(QueryParams* q, std::string_view k) {
  q->erase(std::remove_if(q->begin(), q->end(), [k](const auto& kv) { return kv.first == k; }),
           q->end());
}

} // namespace util
