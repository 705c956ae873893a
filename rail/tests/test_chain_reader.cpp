#include <catch2/catch_test_macros.hpp>
#include "../src/chain_reader.hpp"
#include "../src/abi.hpp"
#include "fakes.hpp"

static std::string word(const std::string& hex) {
    return std::string(64 - hex.size(), '0') + hex;
}

static std::string right_word(const std::string& hex) {
    return hex + std::string(64 - hex.size(), '0');
}

// "USD Coin" as an ABI-encoded dynamic string
static const std::string kEncodedName = "0x" + word("20") + word("8") + right_word("55534420436f696e");
static const std::string kEncodedSymbol = "0x" + word("20") + word("4") + right_word("55534443");

TEST_CASE("ABI helpers", "[abi]") {
    SECTION("Hex to decimal") {
        REQUIRE(*abi::hex_to_decimal("0xde0b6b3a7640000") == "1000000000000000000");
        REQUIRE(*abi::hex_to_decimal("0x0") == "0");
        REQUIRE(*abi::hex_to_decimal("0x" + word("0")) == "0");
        REQUIRE(*abi::hex_to_decimal("0x" + std::string(64, 'f')) ==
                "115792089237316195423570985008687907853269984665640564039457584007913129639935");
        REQUIRE_FALSE(abi::hex_to_decimal("0x").has_value());
        REQUIRE_FALSE(abi::hex_to_decimal("0xzz").has_value());
    }

    SECTION("Small integers") {
        REQUIRE(*abi::decode_small_uint("0x" + word("12")) == 18);
        REQUIRE_FALSE(abi::decode_small_uint("0x" + std::string(64, 'f')).has_value());
    }

    SECTION("Dynamic and bytes32 strings") {
        REQUIRE(*abi::decode_string(kEncodedName) == "USD Coin");
        REQUIRE(*abi::decode_string("0x" + right_word("4d4b52")) == "MKR");
        REQUIRE_FALSE(abi::decode_string("0x").has_value());
        REQUIRE_FALSE(abi::decode_string("0x" + word("20") + word("ffff")).has_value());
    }

    SECTION("Call encoding pads addresses") {
        auto data = abi::encode_call(abi::kSelectorBalanceOf, {"0xAbCdEf0000000000000000000000000000000001"});
        REQUIRE(data == "0x70a08231" + word("abcdef0000000000000000000000000000000001"));
        REQUIRE(abi::encode_call(abi::kSelectorDecimals) == "0x313ce567");
    }

    SECTION("Unit formatting") {
        REQUIRE(abi::format_units("1500000", 6) == "1.500000");
        REQUIRE(abi::format_units("5", 18) == "0.000000000000000005");
        REQUIRE(abi::format_units("0", 6) == "0.000000");
        REQUIRE(abi::format_units("42", 0) == "42");
    }
}

TEST_CASE("Chain reads through the pool", "[chain_reader]") {
    const std::string primary = "https://primary.example.org";
    const std::string backup = "https://backup.example.org";
    const std::string token = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";
    const std::string owner = "0x1111111111111111111111111111111111111111";

    auto http = std::make_shared<FakeHttpClient>();
    auto rpc = std::make_shared<JsonRpcClient>(http);
    auto probe = std::make_shared<FakeProbe>();
    auto store = std::make_shared<MemoryConfigStore>();
    auto pools = std::make_shared<PoolManager>(store, probe);
    auto executor = std::make_shared<FailoverExecutor>(pools, 1000);
    ChainReader reader(executor, rpc);

    probe->set_ok(primary, 1);
    probe->set_ok(backup, 1);
    REQUIRE(pools->set_primary(1, primary).ok());
    REQUIRE(pools->add_backup(1, backup).ok());

    auto token_node = [&](const nlohmann::json& req) {
        std::string method = req["method"].get<std::string>();
        if (method == "eth_getBalance") {
            return rpc_result(req, "0xde0b6b3a7640000");
        }
        if (method != "eth_call") {
            return rpc_error(req, -32601, "Method not found");
        }

        std::string data = req["params"][0]["data"].get<std::string>();
        if (data == abi::encode_call(abi::kSelectorBalanceOf, {owner})) return rpc_result(req, "0x" + word("16e360"));
        if (data == abi::kSelectorDecimals) return rpc_result(req, "0x" + word("6"));
        if (data == abi::kSelectorName) return rpc_result(req, kEncodedName);
        if (data == abi::kSelectorSymbol) return rpc_result(req, kEncodedSymbol);
        if (data == abi::kSelectorTotalSupply) return rpc_result(req, "0x" + word("3b9aca00"));
        return rpc_error(req, 3, "execution reverted");
    };

    SECTION("Native balance in wei and ether") {
        http->on_rpc(primary, token_node);

        auto balance = reader.get_native_balance(1, owner);
        REQUIRE(balance.ok());
        REQUIRE(balance->wei == "1000000000000000000");
        REQUIRE(balance->ether == "1.000000000000000000");
        REQUIRE(balance->endpoint == primary);
    }

    SECTION("Token balance uses the token's decimals") {
        http->on_rpc(primary, token_node);

        auto balance = reader.get_token_balance(1, token, owner);
        REQUIRE(balance.ok());
        REQUIRE(balance->raw == "1500000");
        REQUIRE(balance->decimals == 6);
        REQUIRE(balance->formatted == "1.500000");
    }

    SECTION("Token info fails over to the backup") {
        http->on_rpc(primary, [](const nlohmann::json&) { return timed_out(); });
        http->on_rpc(backup, token_node);

        auto info = reader.get_token_info(1, token);
        REQUIRE(info.ok());
        REQUIRE(info->name == "USD Coin");
        REQUIRE(info->symbol == "USDC");
        REQUIRE(info->decimals == 6);
        REQUIRE(info->total_supply_raw == "1000000000");
        REQUIRE(info->total_supply == "1000.000000");
        REQUIRE(info->endpoint == backup);

        REQUIRE(pools->get(1)->primary.url == backup);
    }

    SECTION("Reverting contract fails on every endpoint") {
        auto reverting = [](const nlohmann::json& req) { return rpc_error(req, 3, "execution reverted"); };
        http->on_rpc(primary, reverting);
        http->on_rpc(backup, reverting);

        auto info = reader.get_token_info(1, token);
        REQUIRE_FALSE(info.ok());
        REQUIRE(info.error().kind == ErrorKind::AllEndpointsFailed);
        REQUIRE(info.error().attempts.size() == 2);
        REQUIRE(info.error().attempts[0].kind == ErrorKind::CallFailed);
    }

    SECTION("Bad addresses are rejected before any call") {
        auto balance = reader.get_native_balance(1, "0x1234");
        REQUIRE(balance.error().kind == ErrorKind::InvalidArgument);

        auto token_balance = reader.get_token_balance(1, token, "vitalik.eth");
        REQUIRE(token_balance.error().kind == ErrorKind::InvalidArgument);

        REQUIRE(http->rpc_calls(primary) == 0);
    }

    SECTION("Unknown chain") {
        auto balance = reader.get_native_balance(56, owner);
        REQUIRE(balance.error().kind == ErrorKind::NoRpcConfigured);
    }
}
