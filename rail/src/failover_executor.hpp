#pragma once

#include "endpoint_pool.hpp"
#include "json_rpc.hpp"
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// A read against a single endpoint. Must honour timeout_ms.
using EndpointOperation = std::function<RpcReply(const std::string& url, int timeout_ms)>;

struct ExecutionResult {
    nlohmann::json value;
    std::string endpoint;
    bool promoted = false;
};

class FailoverExecutor {
public:
    FailoverExecutor(std::shared_ptr<PoolManager> pools, int attempt_timeout_ms = 15000);

    // Tries primary then backups in order. The first endpoint that succeeds
    // becomes primary. Fails with AllEndpointsFailed only when every member failed.
    Outcome<ExecutionResult> execute(ChainId chain_id, const EndpointOperation& operation);

private:
    std::shared_ptr<PoolManager> pools_;
    int attempt_timeout_ms_;
};
