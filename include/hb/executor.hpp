#pragma once

#include <functional>
#include <memory>

#include "hb/config.hpp"
#include "hb/connection.hpp"
#include "hb/model.hpp"

namespace hb
{
// One request/response cycle per call. Implementations never throw for
// request-level problems; those come back as Failure outcomes.
class RequestExecutor
{
public:
    virtual ~RequestExecutor() = default;
    virtual Outcome execute() = 0;
};

// Each worker loop gets its own executor from the factory.
using ExecutorFactory = std::function<std::unique_ptr<RequestExecutor>()>;

class ConnectionExecutor : public RequestExecutor
{
public:
    ConnectionExecutor(std::shared_ptr<const ClientConfig> cfg,
                       std::shared_ptr<TlsContext> tls);

    Outcome execute() override;

private:
    std::shared_ptr<const ClientConfig> cfg_;
    std::shared_ptr<TlsContext> tls_;  // nullptr for plain http
    Connection conn_;                  // kept open between requests when allowed
};

// Creates the TLS context up front for https targets (throws ConfigError).
ExecutorFactory make_executor_factory(std::shared_ptr<const ClientConfig> cfg);
} // namespace hb
