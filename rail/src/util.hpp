#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace util {
    std::string current_iso8601();

    // Hides the host middle and query string; RPC urls often carry API keys
    std::string mask_url(const std::string& url);
    std::string mask_address(const std::string& address);

    bool is_valid_rpc_url(const std::string& url);
    bool is_valid_address(const std::string& address);
    std::string to_lower(std::string str);

    // Accepts "0x1a", "26" or a JSON number
    std::optional<uint64_t> parse_quantity(const nlohmann::json& value);
    std::optional<uint64_t> parse_chain_id(const std::string& text);
}
