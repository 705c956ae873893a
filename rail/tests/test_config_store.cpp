#include <catch2/catch_test_macros.hpp>
#include "../src/config_store.hpp"
#include "../src/util.hpp"
#include <cstdio>
#include <fstream>
#include <string>

static std::string temp_path(const std::string& name) {
    std::string path = "/tmp/rail_test_" + name + ".json";
    std::remove(path.c_str());
    return path;
}

TEST_CASE("Config file store", "[config_store]") {
    SECTION("Missing file loads empty") {
        JsonFileConfigStore store(temp_path("missing"));
        auto snapshot = store.load();
        REQUIRE(snapshot.rpcs.empty());
        REQUIRE(snapshot.api_keys.empty());
    }

    SECTION("Saved pools load back in order") {
        std::string path = temp_path("roundtrip");
        JsonFileConfigStore store(path);

        ConfigSnapshot snapshot;
        snapshot.rpcs[1] = {"https://a.example.org", "https://b.example.org"};
        snapshot.rpcs[137] = {"https://polygon.example.org"};
        snapshot.api_keys["etherscan"] = "key123";
        REQUIRE(store.save(snapshot));

        JsonFileConfigStore reopened(path);
        auto loaded = reopened.load();
        REQUIRE(loaded.rpcs == snapshot.rpcs);
        REQUIRE(loaded.api_keys == snapshot.api_keys);

        std::remove(path.c_str());
    }

    SECTION("Older single-url entries migrate to a list") {
        std::string path = temp_path("legacy");
        {
            std::ofstream out(path);
            out << R"({"rpcs": {"1": "https://legacy.example.org", "bogus": ["https://x.example.org"], "56": []}})";
        }

        JsonFileConfigStore store(path);
        auto loaded = store.load();
        REQUIRE(loaded.rpcs.size() == 1);
        REQUIRE(loaded.rpcs[1] == std::vector<std::string>{"https://legacy.example.org"});

        std::remove(path.c_str());
    }

    SECTION("Corrupt file loads empty") {
        std::string path = temp_path("corrupt");
        {
            std::ofstream out(path);
            out << "{not json";
        }

        JsonFileConfigStore store(path);
        REQUIRE(store.load().rpcs.empty());

        std::remove(path.c_str());
    }

    SECTION("Unwritable location reports failure") {
        JsonFileConfigStore store("/nonexistent-dir/rail/config.json");
        ConfigSnapshot snapshot;
        snapshot.rpcs[1] = {"https://a.example.org"};
        REQUIRE_FALSE(store.save(snapshot));
    }

    SECTION("Document shape") {
        ConfigSnapshot snapshot;
        snapshot.rpcs[10] = {"https://op.example.org"};
        auto doc = JsonFileConfigStore::to_json(snapshot);
        REQUIRE(doc["rpcs"]["10"][0] == "https://op.example.org");
        REQUIRE(doc["api_keys"].is_object());
    }
}

TEST_CASE("Utility functions", "[util]") {
    SECTION("RPC url validation") {
        REQUIRE(util::is_valid_rpc_url("https://eth.llamarpc.com"));
        REQUIRE(util::is_valid_rpc_url("http://localhost:8545"));
        REQUIRE(util::is_valid_rpc_url("HTTPS://rpc.ankr.com/eth/abc"));
        REQUIRE_FALSE(util::is_valid_rpc_url("wss://eth.example.org"));
        REQUIRE_FALSE(util::is_valid_rpc_url("eth.example.org"));
        REQUIRE_FALSE(util::is_valid_rpc_url("https://"));
        REQUIRE_FALSE(util::is_valid_rpc_url(""));
    }

    SECTION("Address validation") {
        REQUIRE(util::is_valid_address("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"));
        REQUIRE_FALSE(util::is_valid_address("A0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"));
        REQUIRE_FALSE(util::is_valid_address("0x123"));
        REQUIRE_FALSE(util::is_valid_address("0xG0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"));
    }

    SECTION("Url masking hides keys") {
        REQUIRE(util::mask_url("https://eth-mainnet.g.alchemy.com/v2/SECRETKEY") ==
                "https://eth-....com/v2/***");
        REQUIRE(util::mask_url("https://rpc.example.io?apikey=abc") == "https://rpc....e.io");
        REQUIRE(util::mask_url("http://localhost:8545") == "http://loca...8545");
        REQUIRE(util::mask_url("garbage") == "***");
    }

    SECTION("Address masking") {
        REQUIRE(util::mask_address("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48") == "0xA0b8...eB48");
    }

    SECTION("Quantities") {
        REQUIRE(*util::parse_quantity("0x89") == 137);
        REQUIRE(*util::parse_quantity("137") == 137);
        REQUIRE(*util::parse_quantity(nlohmann::json(137)) == 137);
        REQUIRE_FALSE(util::parse_quantity("0x").has_value());
        REQUIRE_FALSE(util::parse_quantity("mainnet").has_value());
        REQUIRE_FALSE(util::parse_quantity(nlohmann::json(-1)).has_value());
        REQUIRE_FALSE(util::parse_quantity(nlohmann::json(nullptr)).has_value());
    }

    SECTION("Chain ids") {
        REQUIRE(*util::parse_chain_id("42161") == 42161);
        REQUIRE_FALSE(util::parse_chain_id("0").has_value());
        REQUIRE_FALSE(util::parse_chain_id("-1").has_value());
        REQUIRE_FALSE(util::parse_chain_id("").has_value());
    }
}
