#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.config_path = get_env("RAIL_CONFIG_PATH", "rail_config.json");

    cfg.chain_list_url = get_env("RAIL_CHAIN_LIST_URL", "https://chainid.network/chains.json");
    cfg.cache_duration_seconds = get_env_int("RAIL_CACHE_DURATION", 3600);
    cfg.registry_timeout_ms = get_env_int("RAIL_REGISTRY_TIMEOUT_MS", 10000);
    cfg.scan_workers = get_env_int("RAIL_SCAN_WORKERS", 10);
    cfg.max_candidates = get_env_int("RAIL_MAX_CANDIDATES", 5);

    cfg.probe_timeout_ms = get_env_int("RAIL_PROBE_TIMEOUT_MS", 5000);
    cfg.scan_timeout_ms = get_env_int("RAIL_SCAN_TIMEOUT_MS", 3000);
    cfg.call_timeout_ms = get_env_int("RAIL_CALL_TIMEOUT_MS", 15000);
    cfg.probe_state_read = get_env_int("RAIL_PROBE_STATE_READ", 0) != 0;

    cfg.listen_addr = get_env("LISTEN_ADDR", "127.0.0.1");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "rail");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.log_file = get_env("RAIL_LOG_FILE", "");

    return cfg;
}

void Config::validate() const {
    if (config_path.empty()) {
        throw std::runtime_error("RAIL_CONFIG_PATH must not be empty");
    }
    if (cache_duration_seconds < 0) {
        throw std::runtime_error("RAIL_CACHE_DURATION must not be negative");
    }
    if (probe_timeout_ms <= 0 || scan_timeout_ms <= 0 || call_timeout_ms <= 0 || registry_timeout_ms <= 0) {
        throw std::runtime_error("Timeouts must be positive");
    }
    if (scan_workers <= 0 || max_candidates <= 0) {
        throw std::runtime_error("RAIL_SCAN_WORKERS and RAIL_MAX_CANDIDATES must be positive");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Config file: {}", config_path);
    spdlog::info("  Timeouts: probe={}ms, scan={}ms, call={}ms", probe_timeout_ms, scan_timeout_ms, call_timeout_ms);
    spdlog::info("  Directory cache: {}s, {} scan workers", cache_duration_seconds, scan_workers);
}

RegistrySettings Config::registry_settings() const {
    RegistrySettings s;
    s.chain_list_url = chain_list_url;
    s.ttl_seconds = cache_duration_seconds;
    s.fetch_timeout_ms = registry_timeout_ms;
    s.probe_timeout_ms = scan_timeout_ms;
    s.max_workers = static_cast<size_t>(scan_workers);
    s.max_candidates = static_cast<size_t>(max_candidates);
    return s;
}
