#include "endpoint_pool.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PoolManager::PoolManager(std::shared_ptr<ConfigStore> store,
                         std::shared_ptr<EndpointProbe> probe,
                         int probe_timeout_ms)
    : store_(store)
    , probe_(probe)
    , probe_timeout_ms_(probe_timeout_ms)
{}

PoolManager::ChainSlot& PoolManager::slot(ChainId chain_id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& entry = slots_[chain_id];
    if (!entry) {
        entry = std::make_unique<ChainSlot>();
    }
    return *entry;
}

PoolManager::ChainSlot* PoolManager::find_slot(ChainId chain_id) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(chain_id);
    return it == slots_.end() ? nullptr : it->second.get();
}

std::optional<RailError> PoolManager::validate(ChainId chain_id, const std::string& url) const {
    if (chain_id == 0) {
        return make_error(ErrorKind::InvalidArgument, "Chain id must be a positive integer");
    }
    if (!util::is_valid_rpc_url(url)) {
        return make_error(ErrorKind::InvalidArgument,
                          "Invalid RPC URL " + util::mask_url(url) + ", must start with http:// or https://");
    }
    return std::nullopt;
}

std::optional<RailError> PoolManager::check_backup_slot(const std::optional<EndpointPool>& pool,
                                                        const std::string& url) const {
    if (!pool || !pool->has_primary()) {
        return make_error(ErrorKind::NoPrimaryConfigured, "No primary RPC configured, set one first");
    }
    if (pool->contains(url)) {
        return make_error(ErrorKind::DuplicateEndpoint, "Endpoint already in pool");
    }
    if (pool->backups.size() >= kMaxBackups) {
        return make_error(ErrorKind::PoolFull,
                          "Pool already has " + std::to_string(kMaxBackups) + " backups");
    }
    return std::nullopt;
}

void PoolManager::load() {
    auto snapshot = store_->load();

    {
        std::lock_guard<std::mutex> lock(persist_mutex_);
        api_keys_ = snapshot.api_keys;
    }

    for (const auto& [chain_id, urls] : snapshot.rpcs) {
        EndpointPool pool;

        for (const auto& url : urls) {
            if (validate(chain_id, url)) {
                spdlog::warn("Dropping invalid RPC {} for chain {}", util::mask_url(url), chain_id);
                continue;
            }
            if (pool.contains(url)) {
                spdlog::warn("Dropping duplicate RPC {} for chain {}", util::mask_url(url), chain_id);
                continue;
            }
            if (!pool.has_primary()) {
                pool.primary.url = url;
            } else if (pool.backups.size() < kMaxBackups) {
                pool.backups.push_back(Endpoint{url, std::nullopt, EndpointStatus::Unknown});
            } else {
                spdlog::warn("Dropping extra RPC {} for chain {}", util::mask_url(url), chain_id);
            }
        }

        if (!pool.has_primary()) continue;

        auto& s = slot(chain_id);
        std::lock_guard<std::mutex> lock(s.mutex);
        s.pool = pool;
    }

    spdlog::info("Loaded RPC pools for {} chains", snapshot.rpcs.size());
}

Outcome<double> PoolManager::set_primary(ChainId chain_id, const std::string& url) {
    if (auto err = validate(chain_id, url)) {
        return *err;
    }

    auto result = probe_->probe(url, chain_id, probe_timeout_ms_);
    if (!result.ok) {
        spdlog::warn("Rejected primary {} for chain {}: {}", util::mask_url(url), chain_id,
                     to_string(*result.error));
        return make_error(*result.error, result.message);
    }

    double latency = result.latency_ms.value_or(0.0);

    {
        auto& s = slot(chain_id);
        std::lock_guard<std::mutex> lock(s.mutex);

        EndpointPool pool = s.pool.value_or(EndpointPool{});
        pool.backups.erase(std::remove_if(pool.backups.begin(), pool.backups.end(),
                                          [&url](const Endpoint& e) { return e.url == url; }),
                           pool.backups.end());
        pool.primary = Endpoint{url, latency, EndpointStatus::Healthy};
        s.pool = pool;
    }

    persist();
    spdlog::info("Primary RPC for chain {} set to {} ({:.0f} ms)", chain_id, util::mask_url(url), latency);
    return latency;
}

Outcome<double> PoolManager::add_backup(ChainId chain_id, const std::string& url) {
    if (auto err = validate(chain_id, url)) {
        return *err;
    }

    // Reject caller mistakes before spending a network round trip
    if (auto* s = find_slot(chain_id)) {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (auto err = check_backup_slot(s->pool, url)) {
            return *err;
        }
    } else {
        return make_error(ErrorKind::NoPrimaryConfigured, "No primary RPC configured, set one first");
    }

    auto result = probe_->probe(url, chain_id, probe_timeout_ms_);
    if (!result.ok) {
        spdlog::warn("Rejected backup {} for chain {}: {}", util::mask_url(url), chain_id,
                     to_string(*result.error));
        return make_error(*result.error, result.message);
    }

    double latency = result.latency_ms.value_or(0.0);

    {
        auto& s = slot(chain_id);
        std::lock_guard<std::mutex> lock(s.mutex);

        // The pool may have changed while probing
        if (auto err = check_backup_slot(s.pool, url)) {
            return *err;
        }
        s.pool->backups.push_back(Endpoint{url, latency, EndpointStatus::Healthy});
    }

    persist();
    spdlog::info("Backup RPC {} added for chain {} ({:.0f} ms)", util::mask_url(url), chain_id, latency);
    return latency;
}

Outcome<std::string> PoolManager::rotate(ChainId chain_id) {
    std::string new_primary;

    {
        auto* s = find_slot(chain_id);
        if (!s) {
            return make_error(ErrorKind::NoRpcConfigured,
                              "No RPC configuration for chain " + std::to_string(chain_id));
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        if (!s->pool || !s->pool->has_primary()) {
            return make_error(ErrorKind::NoRpcConfigured,
                              "No RPC configuration for chain " + std::to_string(chain_id));
        }

        auto& pool = *s->pool;
        if (pool.backups.empty()) {
            return make_error(ErrorKind::NoBackupsAvailable, "No backup RPCs to rotate to");
        }

        std::swap(pool.primary, pool.backups.front());
        new_primary = pool.primary.url;
    }

    persist();
    spdlog::info("Rotated chain {} to primary {}", chain_id, util::mask_url(new_primary));
    return new_primary;
}

Outcome<EndpointPool> PoolManager::promote(ChainId chain_id, const std::string& url) {
    EndpointPool promoted;

    {
        auto* s = find_slot(chain_id);
        if (!s) {
            return make_error(ErrorKind::NoRpcConfigured,
                              "No RPC configuration for chain " + std::to_string(chain_id));
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        if (!s->pool || !s->pool->has_primary()) {
            return make_error(ErrorKind::NoRpcConfigured,
                              "No RPC configuration for chain " + std::to_string(chain_id));
        }

        auto& pool = *s->pool;
        if (pool.primary.url == url) {
            return pool;
        }

        auto it = std::find_if(pool.backups.begin(), pool.backups.end(),
                               [&url](const Endpoint& e) { return e.url == url; });
        if (it == pool.backups.end()) {
            return make_error(ErrorKind::UnknownEndpoint, "Endpoint is not a member of the pool");
        }

        Endpoint winner = *it;
        pool.backups.erase(it);
        pool.backups.insert(pool.backups.begin(), pool.primary);
        if (pool.backups.size() > kMaxBackups) {
            pool.backups.resize(kMaxBackups);
        }
        pool.primary = winner;
        promoted = pool;
    }

    persist();
    spdlog::info("Promoted {} to primary for chain {}", util::mask_url(url), chain_id);
    return promoted;
}

Outcome<Unit> PoolManager::remove(ChainId chain_id) {
    {
        auto* s = find_slot(chain_id);
        if (!s) {
            return make_error(ErrorKind::NoRpcConfigured,
                              "No RPC configuration found for chain " + std::to_string(chain_id));
        }

        std::lock_guard<std::mutex> lock(s->mutex);
        if (!s->pool) {
            return make_error(ErrorKind::NoRpcConfigured,
                              "No RPC configuration found for chain " + std::to_string(chain_id));
        }
        s->pool.reset();
    }

    persist();
    spdlog::info("Deleted RPC pool for chain {}", chain_id);
    return Unit{};
}

std::map<ChainId, EndpointPool> PoolManager::list() const {
    std::map<ChainId, EndpointPool> out;

    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (const auto& [chain_id, s] : slots_) {
        std::lock_guard<std::mutex> slot_lock(s->mutex);
        if (s->pool) {
            out[chain_id] = *s->pool;
        }
    }
    return out;
}

Outcome<EndpointPool> PoolManager::get(ChainId chain_id) const {
    auto* s = find_slot(chain_id);
    if (s) {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->pool && s->pool->has_primary()) {
            return *s->pool;
        }
    }
    return make_error(ErrorKind::NoRpcConfigured,
                      "No RPC configuration for chain " + std::to_string(chain_id));
}

void PoolManager::record_outcome(ChainId chain_id, const std::string& url,
                                 EndpointStatus status, std::optional<double> latency_ms) {
    auto* s = find_slot(chain_id);
    if (!s) return;

    std::lock_guard<std::mutex> lock(s->mutex);
    if (!s->pool) return;

    auto update = [&](Endpoint& e) {
        e.last_status = status;
        if (latency_ms) e.last_latency_ms = latency_ms;
    };

    if (s->pool->primary.url == url) {
        update(s->pool->primary);
        return;
    }
    for (auto& b : s->pool->backups) {
        if (b.url == url) {
            update(b);
            return;
        }
    }
}

void PoolManager::persist() {
    // Snapshot and save under one lock so the last save carries the latest state
    std::lock_guard<std::mutex> lock(persist_mutex_);

    ConfigSnapshot snapshot;
    snapshot.api_keys = api_keys_;
    for (const auto& [chain_id, pool] : list()) {
        snapshot.rpcs[chain_id] = pool.urls();
    }

    if (!store_->save(snapshot)) {
        spdlog::error("Failed to persist RPC configuration");
    }
}
