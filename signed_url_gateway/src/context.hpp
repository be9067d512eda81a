#pragma once

#include <string>
#include <utility>

namespace signing {

// Attributes of the request currently being served.
class ContextProvider {
public:
  virtual ~ContextProvider() = default;
  virtual std::string client_address() const = 0;
  virtual std::string user_agent() const = 0;
};

// Snapshot of one request's client attributes.
class RequestContext final : public ContextProvider {
public:
  RequestContext() = default;
  RequestContext(std::string client_address, std::string user_agent)
    : client_address_(std::move(client_address)), user_agent_(std::move(user_agent)) {}

  std::string client_address() const override { return client_address_; }
  std::string user_agent() const override { return user_agent_; }

private:
  std::string client_address_;
  std::string user_agent_;
};

} // namespace signing
