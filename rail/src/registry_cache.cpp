#include "registry_cache.hpp"
#include "fan_out.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

RegistryCache::RegistryCache(std::shared_ptr<HttpClient> http,
                             std::shared_ptr<EndpointProbe> probe,
                             const RegistrySettings& settings)
    : http_(http)
    , probe_(probe)
    , settings_(settings)
{}

bool RegistryCache::is_fresh(const Entry& entry) const {
    auto age = std::chrono::steady_clock::now() - entry.fetched_at;
    return age < std::chrono::seconds(settings_.ttl_seconds);
}

size_t RegistryCache::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

std::shared_ptr<const nlohmann::json> RegistryCache::fetch() {
    spdlog::info("Fetching chain directory from {}", settings_.chain_list_url);

    auto response = http_->get(settings_.chain_list_url, settings_.fetch_timeout_ms);
    if (!response.transport_ok) {
        spdlog::error("Chain directory fetch failed: {}", response.error);
        return nullptr;
    }
    if (response.status < 200 || response.status >= 300) {
        spdlog::error("Chain directory fetch returned HTTP {}", response.status);
        return nullptr;
    }

    try {
        auto data = std::make_shared<nlohmann::json>(nlohmann::json::parse(response.body));
        if (!data->is_array()) {
            spdlog::error("Chain directory is not a JSON array");
            return nullptr;
        }
        spdlog::info("Chain directory fetched: {} chains", data->size());
        return data;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse chain directory: {}", e.what());
        return nullptr;
    }
}

std::shared_ptr<const nlohmann::json> RegistryCache::directory() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (entry_ && is_fresh(*entry_)) {
        return entry_->payload;
    }

    // Another caller is already refreshing; reuse whatever it lands
    if (refreshing_) {
        refreshed_.wait(lock, [this] { return !refreshing_; });
        return entry_ ? entry_->payload : nullptr;
    }

    refreshing_ = true;
    ++fetch_count_;

    // Clears the flag and wakes waiters however the fetch ends
    struct RefreshGuard {
        std::unique_lock<std::mutex>& lock;
        bool& refreshing;
        std::condition_variable& refreshed;

        ~RefreshGuard() {
            if (!lock.owns_lock()) lock.lock();
            refreshing = false;
            refreshed.notify_all();
        }
    } guard{lock, refreshing_, refreshed_};

    lock.unlock();

    std::shared_ptr<const nlohmann::json> fresh;
    try {
        fresh = fetch();
    } catch (const std::exception& e) {
        spdlog::error("Chain directory fetch threw: {}", e.what());
    } catch (...) {
        spdlog::error("Chain directory fetch threw an unknown exception");
    }

    lock.lock();
    if (fresh) {
        entry_ = Entry{std::chrono::steady_clock::now(), fresh};
    } else if (entry_) {
        spdlog::warn("Using stale chain directory after failed refresh");
    }

    return entry_ ? entry_->payload : nullptr;
}

std::vector<std::string> RegistryCache::extract_urls(const nlohmann::json& directory, ChainId chain_id) {
    std::vector<std::string> urls;
    std::set<std::string> seen;

    if (!directory.is_array()) return urls;

    for (const auto& chain : directory) {
        if (!chain.is_object() || !chain.contains("chainId")) continue;

        auto id = util::parse_quantity(chain["chainId"]);
        if (!id || *id != chain_id) continue;

        if (!chain.contains("rpc") || !chain["rpc"].is_array()) continue;

        for (const auto& rpc : chain["rpc"]) {
            std::string url;
            if (rpc.is_string()) {
                url = rpc.get<std::string>();
            } else if (rpc.is_object() && rpc.contains("url") && rpc["url"].is_string()) {
                url = rpc["url"].get<std::string>();
            } else {
                continue;
            }

            // Skip websocket urls and templates that need an API key
            std::string lower = util::to_lower(url);
            if (lower.rfind("http://", 0) != 0 && lower.rfind("https://", 0) != 0) continue;
            if (url.find("${") != std::string::npos) continue;

            if (seen.insert(url).second) {
                urls.push_back(url);
            }
        }
    }

    return urls;
}

Outcome<std::vector<RankedCandidate>> RegistryCache::get_ranked_candidates(ChainId chain_id) {
    if (chain_id == 0) {
        return make_error(ErrorKind::InvalidArgument, "Chain id must be a positive integer");
    }

    auto dir = directory();
    if (!dir) {
        return make_error(ErrorKind::RegistryUnavailable, "Chain directory unavailable");
    }

    auto urls = extract_urls(*dir, chain_id);
    spdlog::info("Probing {} directory candidates for chain {}", urls.size(), chain_id);

    std::vector<ProbeResult> results;
    try {
        results = parallel_map<ProbeResult>(urls.size(), settings_.max_workers, [&](size_t i) {
            return probe_->probe(urls[i], chain_id, settings_.probe_timeout_ms);
        });
    } catch (const std::exception& e) {
        spdlog::error("Candidate probing failed: {}", e.what());
        return make_error(ErrorKind::RegistryUnavailable, std::string("Probing failed: ") + e.what());
    }

    std::vector<RankedCandidate> ranked;
    for (size_t i = 0; i < urls.size(); ++i) {
        if (results[i].ok) {
            ranked.push_back(RankedCandidate{urls[i], results[i].latency_ms.value_or(0.0)});
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
        return a.latency_ms < b.latency_ms;
    });

    if (ranked.size() > settings_.max_candidates) {
        ranked.resize(settings_.max_candidates);
    }

    spdlog::info("Chain {}: {} of {} candidates reachable", chain_id, ranked.size(), urls.size());
    return ranked;
}

Outcome<std::vector<std::string>> RegistryCache::get_candidates(ChainId chain_id) {
    auto ranked = get_ranked_candidates(chain_id);
    if (!ranked) {
        return ranked.error();
    }

    std::vector<std::string> urls;
    for (const auto& c : ranked.value()) {
        urls.push_back(c.url);
    }
    return urls;
}
