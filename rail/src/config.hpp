#pragma once

#include "registry_cache.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Persistence
    std::string config_path;

    // Chain directory
    std::string chain_list_url;
    int cache_duration_seconds;
    int registry_timeout_ms;
    int scan_workers;
    int max_candidates;

    // Timeouts
    int probe_timeout_ms;
    int scan_timeout_ms;
    int call_timeout_ms;
    bool probe_state_read;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;
    std::string log_file;

    static Config from_env();
    void validate() const;

    RegistrySettings registry_settings() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
