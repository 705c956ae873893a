#pragma once

#include "failover_executor.hpp"
#include "json_rpc.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

struct NativeBalance {
    std::string address;
    std::string wei;
    std::string ether;
    std::string endpoint;
};

struct TokenBalance {
    std::string token;
    std::string owner;
    std::string raw;
    unsigned decimals;
    std::string formatted;
    std::string endpoint;
};

struct TokenInfo {
    std::string token;
    std::string name;
    std::string symbol;
    unsigned decimals;
    std::string total_supply_raw;
    std::string total_supply;
    std::string endpoint;
};

// Read-only calls routed through the failover executor
class ChainReader {
public:
    ChainReader(std::shared_ptr<FailoverExecutor> executor, std::shared_ptr<JsonRpcClient> rpc);

    Outcome<NativeBalance> get_native_balance(ChainId chain_id, const std::string& address);
    Outcome<TokenBalance> get_token_balance(ChainId chain_id, const std::string& token, const std::string& owner);
    Outcome<TokenInfo> get_token_info(ChainId chain_id, const std::string& token);

private:
    std::shared_ptr<FailoverExecutor> executor_;
    std::shared_ptr<JsonRpcClient> rpc_;

    RpcReply eth_call(const std::string& url, const std::string& to, const std::string& data, int timeout_ms);
    RpcReply read_decimals(const std::string& url, const std::string& token, int timeout_ms);
};

nlohmann::json to_json(const NativeBalance& balance);
nlohmann::json to_json(const TokenBalance& balance);
nlohmann::json to_json(const TokenInfo& info);
