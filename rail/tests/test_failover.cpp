#include <catch2/catch_test_macros.hpp>
#include "../src/failover_executor.hpp"
#include "fakes.hpp"
#include <stdexcept>
#include <vector>

static RpcReply success(const nlohmann::json& value) {
    RpcReply r;
    r.ok = true;
    r.result = value;
    r.latency_ms = 5.0;
    return r;
}

static RpcReply failure(ErrorKind kind) {
    RpcReply r;
    r.error = kind;
    r.message = to_string(kind);
    return r;
}

TEST_CASE("Failover across the pool", "[failover]") {
    const std::string a = "https://rpc-a.example.org";
    const std::string b = "https://rpc-b.example.org";
    const std::string c = "https://rpc-c.example.org";

    auto store = std::make_shared<MemoryConfigStore>();
    auto probe = std::make_shared<FakeProbe>();
    auto pools = std::make_shared<PoolManager>(store, probe);
    FailoverExecutor executor(pools, 1000);

    probe->set_ok(a, 1);
    probe->set_ok(b, 1);
    probe->set_ok(c, 1);

    SECTION("No pool configured") {
        auto result = executor.execute(1, [](const std::string&, int) { return success(1); });
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().kind == ErrorKind::NoRpcConfigured);
    }

    REQUIRE(pools->set_primary(1, a).ok());
    REQUIRE(pools->add_backup(1, b).ok());

    SECTION("Healthy primary answers without reordering or saving") {
        int saves = store->save_count;
        std::vector<std::string> tried;

        auto result = executor.execute(1, [&](const std::string& url, int timeout_ms) {
            tried.push_back(url);
            REQUIRE(timeout_ms == 1000);
            return success("0x10");
        });

        REQUIRE(result.ok());
        REQUIRE(result->endpoint == a);
        REQUIRE(result->value == "0x10");
        REQUIRE_FALSE(result->promoted);
        REQUIRE(tried == std::vector<std::string>{a});
        REQUIRE(store->save_count == saves);
    }

    SECTION("Timed out primary hands over to the backup, which is promoted") {
        auto result = executor.execute(1, [&](const std::string& url, int) {
            if (url == a) return failure(ErrorKind::Timeout);
            return success("0x1");
        });

        REQUIRE(result.ok());
        REQUIRE(result->endpoint == b);
        REQUIRE(result->promoted);

        auto pool = pools->get(1);
        REQUIRE(pool->urls() == std::vector<std::string>{b, a});
        REQUIRE(pool->backups[0].last_status == EndpointStatus::Failing);
        REQUIRE(store->snapshot.rpcs[1] == std::vector<std::string>{b, a});

        SECTION("Next call goes to the promoted endpoint first") {
            std::vector<std::string> tried;
            auto next = executor.execute(1, [&](const std::string& url, int) {
                tried.push_back(url);
                return success("0x2");
            });
            REQUIRE(next.ok());
            REQUIRE(tried == std::vector<std::string>{b});
        }
    }

    SECTION("Every member failing reports each attempt in order") {
        REQUIRE(pools->add_backup(1, c).ok());

        auto result = executor.execute(1, [&](const std::string& url, int) {
            if (url == a) return failure(ErrorKind::Unreachable);
            if (url == b) return failure(ErrorKind::CallFailed);
            return failure(ErrorKind::MalformedResponse);
        });

        REQUIRE_FALSE(result.ok());
        const auto& err = result.error();
        REQUIRE(err.kind == ErrorKind::AllEndpointsFailed);
        REQUIRE(err.attempts.size() == 3);
        REQUIRE(err.attempts[0].url == a);
        REQUIRE(err.attempts[0].kind == ErrorKind::Unreachable);
        REQUIRE(err.attempts[1].url == b);
        REQUIRE(err.attempts[1].kind == ErrorKind::CallFailed);
        REQUIRE(err.attempts[2].url == c);
        REQUIRE(err.attempts[2].kind == ErrorKind::MalformedResponse);

        REQUIRE(pools->get(1)->urls() == std::vector<std::string>{a, b, c});
    }

    SECTION("Exceptions from the operation count as a failed attempt") {
        auto result = executor.execute(1, [&](const std::string& url, int) -> RpcReply {
            if (url == a) throw std::runtime_error("bad payload");
            return success(true);
        });

        REQUIRE(result.ok());
        REQUIRE(result->endpoint == b);
    }

    SECTION("Non-standard exceptions also count as a failed attempt") {
        auto result = executor.execute(1, [&](const std::string& url, int) -> RpcReply {
            if (url == a) throw 42;
            return success(true);
        });

        REQUIRE(result.ok());
        REQUIRE(result->endpoint == b);
        REQUIRE(pools->get(1)->backups[0].last_status == EndpointStatus::Failing);
    }

    SECTION("Invalid arguments stop the walk immediately") {
        std::vector<std::string> tried;
        auto result = executor.execute(1, [&](const std::string& url, int) {
            tried.push_back(url);
            return failure(ErrorKind::InvalidArgument);
        });

        REQUIRE(result.error().kind == ErrorKind::InvalidArgument);
        REQUIRE(tried.size() == 1);
    }
}
