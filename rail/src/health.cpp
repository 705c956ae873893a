#include "health.hpp"
#include "fan_out.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

HealthCheck::HealthCheck(std::shared_ptr<PoolManager> pools,
                         std::shared_ptr<EndpointProbe> probe,
                         int probe_timeout_ms)
    : pools_(pools), probe_(probe), probe_timeout_ms_(probe_timeout_ms) {}

Outcome<std::vector<EndpointHealth>> HealthCheck::report(ChainId chain_id) const {
    auto pool = pools_->get(chain_id);
    if (!pool) {
        return pool.error();
    }

    auto urls = pool->urls();

    std::vector<ProbeResult> probes;
    try {
        probes = parallel_map<ProbeResult>(urls.size(), urls.size(), [&](size_t i) {
            return probe_->probe(urls[i], chain_id, probe_timeout_ms_);
        });
    } catch (const std::exception& e) {
        spdlog::error("Health probe for chain {} failed: {}", chain_id, e.what());
        return make_error(ErrorKind::Unreachable, e.what());
    }

    std::vector<EndpointHealth> report;
    for (size_t i = 0; i < urls.size(); ++i) {
        EndpointHealth h;
        h.url = urls[i];
        h.role = i == 0 ? "primary" : "backup " + std::to_string(i);
        h.probe = probes[i];
        report.push_back(h);
    }
    return report;
}

nlohmann::json HealthCheck::get_status() const {
    nlohmann::json chains = nlohmann::json::object();
    bool all_primaries_ok = true;

    for (const auto& [chain_id, pool] : pools_->list()) {
        auto result = report(chain_id);
        if (!result) continue;

        nlohmann::json endpoints = nlohmann::json::array();
        for (const auto& h : result.value()) {
            endpoints.push_back(to_json(h));
        }
        if (!result.value().empty() && !result.value().front().probe.ok) {
            all_primaries_ok = false;
        }
        chains[std::to_string(chain_id)] = endpoints;
    }

    return nlohmann::json{
        {"ok", true},
        {"primaries_healthy", all_primaries_ok},
        {"chains", chains},
        {"ts", util::current_iso8601()}
    };
}

nlohmann::json to_json(const ProbeResult& result) {
    nlohmann::json j = {{"healthy", result.ok}};
    j["latency_ms"] = result.latency_ms ? nlohmann::json(*result.latency_ms) : nlohmann::json(nullptr);
    j["chain_id"] = result.reported_chain_id ? nlohmann::json(*result.reported_chain_id) : nlohmann::json(nullptr);
    if (result.error) {
        j["error"] = to_string(*result.error);
        j["message"] = result.message;
    }
    return j;
}

nlohmann::json to_json(const EndpointHealth& health) {
    auto j = to_json(health.probe);
    j["url"] = util::mask_url(health.url);
    j["role"] = health.role;
    return j;
}
