#pragma once

#include "types.hpp"
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual ConfigSnapshot load() = 0;
    virtual bool save(const ConfigSnapshot& snapshot) = 0;
};

// {"rpcs": {"1": ["primary", "backup"]}, "api_keys": {...}}
class JsonFileConfigStore : public ConfigStore {
public:
    explicit JsonFileConfigStore(const std::string& path);

    ConfigSnapshot load() override;
    bool save(const ConfigSnapshot& snapshot) override;

    static ConfigSnapshot from_json(const nlohmann::json& data);
    static nlohmann::json to_json(const ConfigSnapshot& snapshot);

private:
    std::string path_;
    std::mutex mutex_;
};
