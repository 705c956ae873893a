#include <catch2/catch_test_macros.hpp>
#include "../src/fan_out.hpp"
#include "../src/errors.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

TEST_CASE("Parallel map", "[fan_out]") {
    SECTION("Results keep input order") {
        auto results = parallel_map<int>(20, 4, [](size_t i) {
            std::this_thread::sleep_for(std::chrono::milliseconds((20 - i) % 5));
            return static_cast<int>(i * i);
        });
        REQUIRE(results.size() == 20);
        for (size_t i = 0; i < results.size(); ++i) {
            REQUIRE(results[i] == static_cast<int>(i * i));
        }
    }

    SECTION("Never more workers than asked for") {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};

        parallel_map<int>(12, 3, [&](size_t) {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
            return 0;
        });

        REQUIRE(peak <= 3);
        REQUIRE(running == 0);
    }

    SECTION("Empty input") {
        REQUIRE(parallel_map<int>(0, 4, [](size_t) { return 1; }).empty());
    }

    SECTION("Task exception surfaces after all tasks ran") {
        std::atomic<int> finished{0};
        REQUIRE_THROWS_AS(parallel_map<int>(8, 2, [&](size_t i) -> int {
            if (i == 3) throw std::runtime_error("boom");
            ++finished;
            return 0;
        }), std::runtime_error);
        REQUIRE(finished == 7);
    }
}

TEST_CASE("Error kinds", "[errors]") {
    SECTION("Stable names and codes") {
        REQUIRE(std::string(to_string(ErrorKind::Unreachable)) == "Unreachable");
        REQUIRE(error_code(ErrorKind::Unreachable) == 1001);
        REQUIRE(error_code(ErrorKind::ChainMismatch) == 1002);
        REQUIRE(error_code(ErrorKind::AllEndpointsFailed) == 1003);
        REQUIRE(error_code(ErrorKind::Timeout) == 1004);
        REQUIRE(error_code(ErrorKind::InvalidArgument) == 2006);
        REQUIRE(error_code(ErrorKind::CallFailed) == 3003);
    }

    SECTION("Endpoint faults") {
        REQUIRE(is_endpoint_fault(ErrorKind::Timeout));
        REQUIRE(is_endpoint_fault(ErrorKind::MalformedResponse));
        REQUIRE_FALSE(is_endpoint_fault(ErrorKind::PoolFull));
        REQUIRE_FALSE(is_endpoint_fault(ErrorKind::AllEndpointsFailed));
    }

    SECTION("Outcome carries either side") {
        Outcome<int> good(5);
        REQUIRE(good.ok());
        REQUIRE(good.value() == 5);

        Outcome<int> bad(make_error(ErrorKind::PoolFull));
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().kind == ErrorKind::PoolFull);
        REQUIRE(bad.error().message == "PoolFull");
    }
}
