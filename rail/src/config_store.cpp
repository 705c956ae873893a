#include "config_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdio>

JsonFileConfigStore::JsonFileConfigStore(const std::string& path) : path_(path) {}

ConfigSnapshot JsonFileConfigStore::from_json(const nlohmann::json& data) {
    ConfigSnapshot snapshot;

    if (!data.is_object()) {
        spdlog::warn("Config root is not an object, ignoring");
        return snapshot;
    }

    if (data.contains("rpcs") && data["rpcs"].is_object()) {
        for (const auto& [key, value] : data["rpcs"].items()) {
            auto chain_id = util::parse_chain_id(key);
            if (!chain_id) {
                spdlog::warn("Skipping invalid chain id '{}' in config", key);
                continue;
            }

            std::vector<std::string> urls;
            if (value.is_string()) {
                // Older files stored a single url per chain
                urls.push_back(value.get<std::string>());
            } else if (value.is_array()) {
                for (const auto& url : value) {
                    if (url.is_string()) {
                        urls.push_back(url.get<std::string>());
                    }
                }
            }

            if (!urls.empty()) {
                snapshot.rpcs[*chain_id] = urls;
            }
        }
    }

    if (data.contains("api_keys") && data["api_keys"].is_object()) {
        for (const auto& [name, key] : data["api_keys"].items()) {
            if (key.is_string()) {
                snapshot.api_keys[name] = key.get<std::string>();
            }
        }
    }

    return snapshot;
}

nlohmann::json JsonFileConfigStore::to_json(const ConfigSnapshot& snapshot) {
    nlohmann::json rpcs = nlohmann::json::object();
    for (const auto& [chain_id, urls] : snapshot.rpcs) {
        rpcs[std::to_string(chain_id)] = urls;
    }

    nlohmann::json keys = nlohmann::json::object();
    for (const auto& [name, key] : snapshot.api_keys) {
        keys[name] = key;
    }

    return nlohmann::json{{"rpcs", rpcs}, {"api_keys", keys}};
}

ConfigSnapshot JsonFileConfigStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path_);
    if (!in) {
        spdlog::info("Config file {} not found, starting empty", path_);
        return ConfigSnapshot{};
    }

    try {
        nlohmann::json data;
        in >> data;
        auto snapshot = from_json(data);
        spdlog::info("Loaded {} chain pools from {}", snapshot.rpcs.size(), path_);
        return snapshot;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load config {}: {}", path_, e.what());
        return ConfigSnapshot{};
    }
}

bool JsonFileConfigStore::save(const ConfigSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Write a sibling file, then rename it over the config file
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open {} for writing", tmp_path);
            return false;
        }
        out << to_json(snapshot).dump(2);
        if (!out) {
            spdlog::error("Failed to write {}", tmp_path);
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        spdlog::error("Failed to replace config file {}", path_);
        return false;
    }

    spdlog::debug("Saved {} chain pools to {}", snapshot.rpcs.size(), path_);
    return true;
}
