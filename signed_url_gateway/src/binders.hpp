#pragma once

#include "context.hpp"
#include "options.hpp"
#include "util.hpp"

#include <memory>
#include <vector>

namespace signing {

// Contributes hidden key/value pairs to the digest input. Binders run in
// registration order on both sign and verify and must return the same pairs
// for the same client, otherwise verification fails.
class AttributeBinder {
public:
  virtual ~AttributeBinder() = default;
  virtual util::QueryParams bind(const ContextProvider& ctx, const Options& options) const = 0;
};

using BinderList = std::vector<std::shared_ptr<const AttributeBinder>>;

// "ip" -> ip=<client address>
class ClientAddressBinder final : public AttributeBinder {
public:
  util::QueryParams bind(const ContextProvider& ctx, const Options& options) const override;
};

// "ua" -> user_agent=<raw User-Agent>
class UserAgentBinder final : public AttributeBinder {
public:
  util::QueryParams bind(const ContextProvider& ctx, const Options& options) const override;
};

// Client address, then user agent.
BinderList default_binders();

} // namespace signing
