#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace signing {

enum class OptionFlag {
  ClientIp,
  UserAgent
};

// "ip" / "ua"
std::string_view option_name(OptionFlag flag);

// Contextual bindings requested for a URL, carried as "o=ip:ua".
// Custom flags are kept verbatim so third-party binders can look for them.
class Options {
public:
  Options() = default;
  explicit Options(std::vector<std::string> names);

  static Options parse(std::string_view encoded);

  bool has(std::string_view name) const;
  bool has(OptionFlag flag) const { return has(option_name(flag)); }

  void add(std::string_view name);
  void add(OptionFlag flag) { add(option_name(flag)); }

  bool empty() const { return names_.empty(); }
  const std::vector<std::string>& names() const { return names_; }

  std::string encode() const;

private:
  std::vector<std::string> names_;
};

} // namespace signing
