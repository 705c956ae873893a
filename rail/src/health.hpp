#pragma once

#include "endpoint_pool.hpp"
#include "endpoint_probe.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

struct EndpointHealth {
    std::string url;
    std::string role; // "primary", "backup 1", "backup 2"
    ProbeResult probe;
};

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<PoolManager> pools,
                std::shared_ptr<EndpointProbe> probe,
                int probe_timeout_ms = 5000);

    // Probes every member concurrently, reported in pool order. Never promotes.
    Outcome<std::vector<EndpointHealth>> report(ChainId chain_id) const;

    nlohmann::json get_status() const;

private:
    std::shared_ptr<PoolManager> pools_;
    std::shared_ptr<EndpointProbe> probe_;
    int probe_timeout_ms_;
};

nlohmann::json to_json(const EndpointHealth& health);
nlohmann::json to_json(const ProbeResult& result);
