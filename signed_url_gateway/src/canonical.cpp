#include "canonical.hpp"

#include <algorithm>
#include <iterator>

namespace signing {

std::string canonical_query(const util::QueryParams& params) {
  util::QueryParams sorted;
  sorted.reserve(params.size());
  std::copy_if(params.begin(), params.end(), std::back_inserter(sorted),
               [](const auto& kv) { return kv.first != kTokenParam; });
  std::sort(sorted.begin(), sorted.end());
  return util::encode_query(sorted);
}

std::string canonicalize(std::string_view path, const util::QueryParams& params) {
  std::string out(path.empty() ? std::string_view("/") : path);
  out.push_back('?');
  out += canonical_query(params);
  return out;
}

} // namespace signing
