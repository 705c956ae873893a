#include "chain_reader.hpp"
#include "abi.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

static RpcReply malformed(const std::string& message) {
    RpcReply reply;
    reply.error = ErrorKind::MalformedResponse;
    reply.message = message;
    return reply;
}

static std::optional<RailError> check_address(const std::string& address, const std::string& name) {
    if (!util::is_valid_address(address)) {
        return make_error(ErrorKind::InvalidArgument,
                          "Invalid " + name + " '" + util::mask_address(address) +
                          "', expected 0x followed by 40 hex characters");
    }
    return std::nullopt;
}

ChainReader::ChainReader(std::shared_ptr<FailoverExecutor> executor, std::shared_ptr<JsonRpcClient> rpc)
    : executor_(executor), rpc_(rpc) {}

RpcReply ChainReader::eth_call(const std::string& url, const std::string& to,
                               const std::string& data, int timeout_ms) {
    nlohmann::json params = nlohmann::json::array({
        {{"to", to}, {"data", data}},
        "latest"
    });

    auto reply = rpc_->call(url, "eth_call", params, timeout_ms);
    if (reply.ok && !reply.result.is_string()) {
        return malformed("eth_call result is not a hex string");
    }
    return reply;
}

RpcReply ChainReader::read_decimals(const std::string& url, const std::string& token, int timeout_ms) {
    auto reply = eth_call(url, token, abi::encode_call(abi::kSelectorDecimals), timeout_ms);
    if (!reply.ok) return reply;

    auto decimals = abi::decode_small_uint(reply.result.get<std::string>());
    if (!decimals || *decimals > 255) {
        return malformed("Undecodable decimals()");
    }
    reply.result = *decimals;
    return reply;
}

Outcome<NativeBalance> ChainReader::get_native_balance(ChainId chain_id, const std::string& address) {
    if (auto err = check_address(address, "address")) {
        return *err;
    }

    auto outcome = executor_->execute(chain_id, [&](const std::string& url, int timeout_ms) {
        auto reply = rpc_->call(url, "eth_getBalance", nlohmann::json::array({address, "latest"}), timeout_ms);
        if (!reply.ok) return reply;

        if (!reply.result.is_string() || !abi::hex_to_decimal(reply.result.get<std::string>())) {
            return malformed("eth_getBalance result is not a quantity");
        }
        return reply;
    });

    if (!outcome) {
        return outcome.error();
    }

    NativeBalance balance;
    balance.address = address;
    balance.wei = *abi::hex_to_decimal(outcome->value.get<std::string>());
    balance.ether = abi::format_units(balance.wei, 18);
    balance.endpoint = outcome->endpoint;

    spdlog::info("Native balance of {} on chain {}: {}", util::mask_address(address), chain_id, balance.ether);
    return balance;
}

Outcome<TokenBalance> ChainReader::get_token_balance(ChainId chain_id, const std::string& token,
                                                     const std::string& owner) {
    if (auto err = check_address(token, "token address")) {
        return *err;
    }
    if (auto err = check_address(owner, "owner address")) {
        return *err;
    }

    auto outcome = executor_->execute(chain_id, [&](const std::string& url, int timeout_ms) {
        auto balance = eth_call(url, token, abi::encode_call(abi::kSelectorBalanceOf, {owner}), timeout_ms);
        if (!balance.ok) return balance;

        auto raw = abi::hex_to_decimal(balance.result.get<std::string>());
        if (!raw) return malformed("Undecodable balanceOf()");

        auto decimals = read_decimals(url, token, timeout_ms);
        if (!decimals.ok) return decimals;

        RpcReply reply;
        reply.ok = true;
        reply.result = {{"raw", *raw}, {"decimals", decimals.result}};
        return reply;
    });

    if (!outcome) {
        return outcome.error();
    }

    TokenBalance result;
    result.token = token;
    result.owner = owner;
    result.raw = outcome->value["raw"].get<std::string>();
    result.decimals = outcome->value["decimals"].get<unsigned>();
    result.formatted = abi::format_units(result.raw, result.decimals);
    result.endpoint = outcome->endpoint;
    return result;
}

Outcome<TokenInfo> ChainReader::get_token_info(ChainId chain_id, const std::string& token) {
    if (auto err = check_address(token, "token address")) {
        return *err;
    }

    auto outcome = executor_->execute(chain_id, [&](const std::string& url, int timeout_ms) {
        nlohmann::json info;

        for (const auto& [field, selector] : {std::make_pair("name", abi::kSelectorName),
                                              std::make_pair("symbol", abi::kSelectorSymbol)}) {
            auto reply = eth_call(url, token, abi::encode_call(selector), timeout_ms);
            if (!reply.ok) return reply;

            auto text = abi::decode_string(reply.result.get<std::string>());
            if (!text) return malformed(std::string("Undecodable ") + field + "()");
            info[field] = *text;
        }

        auto decimals = read_decimals(url, token, timeout_ms);
        if (!decimals.ok) return decimals;
        info["decimals"] = decimals.result;

        auto supply = eth_call(url, token, abi::encode_call(abi::kSelectorTotalSupply), timeout_ms);
        if (!supply.ok) return supply;

        auto raw = abi::hex_to_decimal(supply.result.get<std::string>());
        if (!raw) return malformed("Undecodable totalSupply()");
        info["total_supply"] = *raw;

        RpcReply reply;
        reply.ok = true;
        reply.result = info;
        return reply;
    });

    if (!outcome) {
        return outcome.error();
    }

    const auto& v = outcome->value;
    TokenInfo info;
    info.token = token;
    info.name = v["name"].get<std::string>();
    info.symbol = v["symbol"].get<std::string>();
    info.decimals = v["decimals"].get<unsigned>();
    info.total_supply_raw = v["total_supply"].get<std::string>();
    info.total_supply = abi::format_units(info.total_supply_raw, info.decimals);
    info.endpoint = outcome->endpoint;
    return info;
}

nlohmann::json to_json(const NativeBalance& balance) {
    return nlohmann::json{
        {"address", balance.address},
        {"wei", balance.wei},
        {"balance", balance.ether},
        {"endpoint", util::mask_url(balance.endpoint)}
    };
}

nlohmann::json to_json(const TokenBalance& balance) {
    return nlohmann::json{
        {"token", balance.token},
        {"owner", balance.owner},
        {"raw", balance.raw},
        {"decimals", balance.decimals},
        {"balance", balance.formatted},
        {"endpoint", util::mask_url(balance.endpoint)}
    };
}

nlohmann::json to_json(const TokenInfo& info) {
    return nlohmann::json{
        {"token", info.token},
        {"name", info.name},
        {"symbol", info.symbol},
        {"decimals", info.decimals},
        {"total_supply_raw", info.total_supply_raw},
        {"total_supply", info.total_supply},
        {"endpoint", util::mask_url(info.endpoint)}
    };
}
