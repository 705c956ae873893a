#include "failover_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

FailoverExecutor::FailoverExecutor(std::shared_ptr<PoolManager> pools, int attempt_timeout_ms)
    : pools_(pools), attempt_timeout_ms_(attempt_timeout_ms) {}

Outcome<ExecutionResult> FailoverExecutor::execute(ChainId chain_id, const EndpointOperation& operation) {
    auto pool = pools_->get(chain_id);
    if (!pool) {
        return make_error(ErrorKind::NoRpcConfigured,
                          "No RPC configuration for chain " + std::to_string(chain_id) +
                          ", set a primary RPC first");
    }

    auto order = pool->urls();
    std::vector<AttemptFailure> failures;

    for (size_t i = 0; i < order.size(); ++i) {
        const auto& url = order[i];

        RpcReply reply;
        try {
            reply = operation(url, attempt_timeout_ms_);
        } catch (const std::exception& e) {
            reply.ok = false;
            reply.error = ErrorKind::MalformedResponse;
            reply.message = e.what();
        } catch (...) {
            reply.ok = false;
            reply.error = ErrorKind::MalformedResponse;
            reply.message = "Operation threw a non-standard exception";
        }

        if (reply.ok) {
            pools_->record_outcome(chain_id, url, EndpointStatus::Healthy, reply.latency_ms);

            ExecutionResult result;
            result.value = reply.result;
            result.endpoint = url;

            if (i > 0) {
                auto promoted = pools_->promote(chain_id, url);
                result.promoted = promoted.ok();
                if (!promoted) {
                    // Pool changed underneath us; the read itself still succeeded
                    spdlog::warn("Could not promote {} for chain {}: {}", util::mask_url(url), chain_id,
                                 promoted.error().message);
                }
            }
            return result;
        }

        ErrorKind kind = reply.error.value_or(ErrorKind::Unreachable);

        // Only endpoint faults move on to the next member
        if (!is_endpoint_fault(kind)) {
            return make_error(kind, reply.message);
        }

        pools_->record_outcome(chain_id, url, EndpointStatus::Failing, reply.latency_ms);
        failures.push_back(AttemptFailure{url, kind, reply.message});
        spdlog::warn("Chain {} endpoint {} failed: {} {}", chain_id, util::mask_url(url),
                     to_string(kind), reply.message);
    }

    RailError err = make_error(ErrorKind::AllEndpointsFailed,
                               "All " + std::to_string(failures.size()) + " RPC endpoints for chain " +
                               std::to_string(chain_id) + " failed");
    err.attempts = failures;
    spdlog::error("{}", err.message);
    return err;
}
