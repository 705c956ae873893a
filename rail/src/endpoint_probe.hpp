#pragma once

#include "json_rpc.hpp"
#include "types.hpp"
#include <memory>
#include <string>

class EndpointProbe {
public:
    EndpointProbe(std::shared_ptr<JsonRpcClient> rpc, bool check_state_read = false);
    virtual ~EndpointProbe() = default;

    // Asks the endpoint for its chain id and compares it with the expected one.
    // Never touches any pool.
    virtual ProbeResult probe(const std::string& url, ChainId expected_chain_id, int timeout_ms);

private:
    std::shared_ptr<JsonRpcClient> rpc_;
    bool check_state_read_;
};
