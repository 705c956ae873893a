#pragma once

#include "http_client.hpp"
#include "endpoint_probe.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RegistrySettings {
    std::string chain_list_url = "https://chainid.network/chains.json";
    int ttl_seconds = 3600;
    int fetch_timeout_ms = 10000;
    int probe_timeout_ms = 3000;
    size_t max_workers = 10;
    size_t max_candidates = 5;
};

struct RankedCandidate {
    std::string url;
    double latency_ms;
};

// Process-wide cache of the public chain directory. Ranks directory urls for
// a chain by probing them in parallel; never touches any pool.
class RegistryCache {
public:
    RegistryCache(std::shared_ptr<HttpClient> http,
                  std::shared_ptr<EndpointProbe> probe,
                  const RegistrySettings& settings);

    Outcome<std::vector<std::string>> get_candidates(ChainId chain_id);
    Outcome<std::vector<RankedCandidate>> get_ranked_candidates(ChainId chain_id);

    // Directory urls for the chain before probing, in directory order
    static std::vector<std::string> extract_urls(const nlohmann::json& directory, ChainId chain_id);

    size_t fetch_count() const;

private:
    struct Entry {
        std::chrono::steady_clock::time_point fetched_at;
        std::shared_ptr<const nlohmann::json> payload;
    };

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<EndpointProbe> probe_;
    RegistrySettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable refreshed_;
    std::optional<Entry> entry_;
    bool refreshing_ = false;
    size_t fetch_count_ = 0;

    bool is_fresh(const Entry& entry) const;
    std::shared_ptr<const nlohmann::json> directory();
    std::shared_ptr<const nlohmann::json> fetch();
};
