#include "json_rpc.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

JsonRpcClient::JsonRpcClient(std::shared_ptr<HttpClient> http)
    : http_(http) {}

nlohmann::json JsonRpcClient::make_payload(const std::string& method, const nlohmann::json& params, int id) {
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::array() : params}
    };
}

RpcReply JsonRpcClient::call(const std::string& url,
                             const std::string& method,
                             const nlohmann::json& params,
                             int timeout_ms) {
    RpcReply reply;
    auto payload = make_payload(method, params, next_id_++);

    auto response = http_->post_json(url, payload.dump(), timeout_ms);

    if (!response.transport_ok) {
        reply.error = response.timed_out ? ErrorKind::Timeout : ErrorKind::Unreachable;
        reply.message = response.error;
        spdlog::debug("{} to {} failed: {}", method, util::mask_url(url), response.error);
        return reply;
    }

    reply.latency_ms = response.elapsed_ms;

    if (response.status < 200 || response.status >= 300) {
        reply.error = ErrorKind::Unreachable;
        reply.message = "HTTP status " + std::to_string(response.status);
        spdlog::debug("{} to {} returned HTTP {}", method, util::mask_url(url), response.status);
        return reply;
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const std::exception& e) {
        reply.error = ErrorKind::MalformedResponse;
        reply.message = std::string("Parse error: ") + e.what();
        spdlog::debug("Failed to parse {} response from {}: {}", method, util::mask_url(url), e.what());
        return reply;
    }

    if (!body.is_object()) {
        reply.error = ErrorKind::MalformedResponse;
        reply.message = "Response is not a JSON object";
        return reply;
    }

    if (body.contains("error") && !body["error"].is_null()) {
        const auto& err = body["error"];
        reply.error = ErrorKind::CallFailed;
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            reply.message = err["message"].get<std::string>();
        } else {
            reply.message = err.dump();
        }
        return reply;
    }

    if (!body.contains("result")) {
        reply.error = ErrorKind::MalformedResponse;
        reply.message = "Missing result";
        return reply;
    }

    reply.ok = true;
    reply.result = body["result"];
    return reply;
}
