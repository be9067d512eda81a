#include "options.hpp"
#include "util.hpp"

#include <algorithm>

namespace signing {

std::string_view option_name(OptionFlag flag) {
  switch (flag) {
    case OptionFlag::ClientIp: return "ip";
    case OptionFlag::UserAgent: return "ua";
  }
  return {};
}

Options::Options(std::vector<std::string> names) {
  for (auto& n : names) add(n);
}

Options Options::parse(std::string_view encoded) {
  Options opts;
  for (const auto& part : util::split(encoded, ':')) {
    opts.add(part);
  }
  return opts;
}

bool Options::has(std::string_view name) const {
  return std::find(names_.begin(), names_.end(), name) != names_.end();
}

void Options::add(std::string_view name) {
  if (name.empty() || has(name)) return;
  names_.emplace_back(name);
}

std::string Options::encode() const {
  std::string out;
  for (size_t i = 0; i < names_.size(); ++i) {
    if (i) out.push_back(':');
    out += names_[i];
  }
  return out;
}

} // namespace signing
