#include "binders.hpp"

namespace signing {

util::QueryParams ClientAddressBinder::bind(const ContextProvider& ctx, const Options& options) const {
  if (!options.has(OptionFlag::ClientIp)) return {};
  return {{"ip", ctx.client_address()}};
}

util::QueryParams UserAgentBinder::bind(const ContextProvider& ctx, const Options& options) const {
  if (!options.has(OptionFlag::UserAgent)) return {};
  return {{"user_agent", ctx.user_agent()}};
}

BinderList default_binders() {
  return {std::make_shared<ClientAddressBinder>(), std::make_shared<UserAgentBinder>()};
}

} // namespace signing
