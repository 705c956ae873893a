#pragma once

#include "types.hpp"
#include "endpoint_probe.hpp"
#include "config_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Owns the per-chain endpoint pools. Every mutation is applied under the
// chain's own mutex and followed by a save through the ConfigStore.
class PoolManager {
public:
    PoolManager(std::shared_ptr<ConfigStore> store,
                std::shared_ptr<EndpointProbe> probe,
                int probe_timeout_ms = 5000);

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    // Rebuilds pools from the store without probing
    void load();

    // Returns the probe latency in milliseconds
    Outcome<double> set_primary(ChainId chain_id, const std::string& url);
    Outcome<double> add_backup(ChainId chain_id, const std::string& url);

    // Swaps the primary with the first backup; returns the new primary url
    Outcome<std::string> rotate(ChainId chain_id);

    Outcome<EndpointPool> promote(ChainId chain_id, const std::string& url);
    Outcome<Unit> remove(ChainId chain_id);

    std::map<ChainId, EndpointPool> list() const;
    Outcome<EndpointPool> get(ChainId chain_id) const;

    // Updates derived metadata only; order is never changed and nothing is saved
    void record_outcome(ChainId chain_id, const std::string& url,
                        EndpointStatus status, std::optional<double> latency_ms);

private:
    struct ChainSlot {
        mutable std::mutex mutex;
        std::optional<EndpointPool> pool;
    };

    std::shared_ptr<ConfigStore> store_;
    std::shared_ptr<EndpointProbe> probe_;
    int probe_timeout_ms_;

    // Slots are never erased, so references stay valid after the map lock is released
    mutable std::mutex slots_mutex_;
    std::map<ChainId, std::unique_ptr<ChainSlot>> slots_;

    std::mutex persist_mutex_;
    std::map<std::string, std::string> api_keys_;

    ChainSlot& slot(ChainId chain_id);
    ChainSlot* find_slot(ChainId chain_id) const;

    std::optional<RailError> validate(ChainId chain_id, const std::string& url) const;
    std::optional<RailError> check_backup_slot(const std::optional<EndpointPool>& pool,
                                               const std::string& url) const;
    void persist();
};
