#pragma once

#include "errors.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <map>

using ChainId = uint64_t;

constexpr size_t kMaxBackups = 2;

enum class EndpointStatus {
    Unknown,
    Healthy,
    Failing
};

const char* to_string(EndpointStatus status);

struct Endpoint {
    std::string url;
    std::optional<double> last_latency_ms;
    EndpointStatus last_status = EndpointStatus::Unknown;
};

// At most one primary and kMaxBackups backups. An empty primary url means the
// chain has no configured RPC.
struct EndpointPool {
    Endpoint primary;
    std::vector<Endpoint> backups;

    bool has_primary() const { return !primary.url.empty(); }
    bool contains(const std::string& url) const;
    std::vector<std::string> urls() const; // primary first, then backups
};

struct ProbeResult {
    bool ok = false;
    std::optional<double> latency_ms;
    std::optional<ErrorKind> error;
    std::optional<uint64_t> reported_chain_id;
    std::string message;
};

// What the configuration store persists. Keys are opaque to the core.
struct ConfigSnapshot {
    std::map<ChainId, std::vector<std::string>> rpcs;
    std::map<std::string, std::string> api_keys;
};
