#pragma once

#include "http_client.hpp"
#include "errors.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <optional>
#include <nlohmann/json.hpp>

struct RpcReply {
    bool ok = false;
    std::optional<ErrorKind> error;
    std::string message;
    nlohmann::json result;
    std::optional<double> latency_ms; // set whenever a response arrived
};

class JsonRpcClient {
public:
    explicit JsonRpcClient(std::shared_ptr<HttpClient> http);

    RpcReply call(const std::string& url,
                  const std::string& method,
                  const nlohmann::json& params,
                  int timeout_ms);

    static nlohmann::json make_payload(const std::string& method, const nlohmann::json& params, int id);

private:
    std::shared_ptr<HttpClient> http_;
    std::atomic<int> next_id_{1};
};
