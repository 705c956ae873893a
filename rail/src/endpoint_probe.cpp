#include "endpoint_probe.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

static const char* kZeroAddress = "0x0000000000000000000000000000000000000000";

EndpointProbe::EndpointProbe(std::shared_ptr<JsonRpcClient> rpc, bool check_state_read)
    : rpc_(rpc), check_state_read_(check_state_read) {}

ProbeResult EndpointProbe::probe(const std::string& url, ChainId expected_chain_id, int timeout_ms) {
    ProbeResult result;

    auto reply = rpc_->call(url, "eth_chainId", nlohmann::json::array(), timeout_ms);
    result.latency_ms = reply.latency_ms;

    if (!reply.ok) {
        // An error object to eth_chainId means the endpoint is not a usable EVM RPC
        result.error = reply.error == ErrorKind::CallFailed ? ErrorKind::MalformedResponse : *reply.error;
        result.message = reply.message;
        spdlog::debug("Probe of {} failed: {} ({})", util::mask_url(url),
                      to_string(*result.error), reply.message);
        return result;
    }

    auto reported = util::parse_quantity(reply.result);
    if (!reported) {
        result.error = ErrorKind::MalformedResponse;
        result.message = "Unparseable chain id: " + reply.result.dump();
        return result;
    }

    result.reported_chain_id = *reported;

    if (*reported != expected_chain_id) {
        result.error = ErrorKind::ChainMismatch;
        result.message = "Expected chain " + std::to_string(expected_chain_id) +
                         ", endpoint reports " + std::to_string(*reported);
        spdlog::debug("Probe of {}: {}", util::mask_url(url), result.message);
        return result;
    }

    if (check_state_read_) {
        auto read = rpc_->call(url, "eth_getBalance", nlohmann::json::array({kZeroAddress, "latest"}), timeout_ms);
        if (!read.ok) {
            result.error = *read.error;
            result.message = "State read failed: " + read.message;
            return result;
        }
    }

    result.ok = true;
    return result;
}
