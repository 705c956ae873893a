#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Minimal ABI helpers for read-only ERC-20 calls
namespace abi {
    constexpr const char* kSelectorName = "0x06fdde03";
    constexpr const char* kSelectorSymbol = "0x95d89b41";
    constexpr const char* kSelectorDecimals = "0x313ce567";
    constexpr const char* kSelectorTotalSupply = "0x18160ddd";
    constexpr const char* kSelectorBalanceOf = "0x70a08231";

    // selector followed by each address left-padded to 32 bytes
    std::string encode_call(const std::string& selector, const std::vector<std::string>& address_args = {});

    // Arbitrary precision; nullopt for empty or non-hex data
    std::optional<std::string> hex_to_decimal(const std::string& hex);
    std::optional<uint64_t> decode_small_uint(const std::string& hex);

    // Dynamic string, or a right-padded bytes32 as some older tokens return
    std::optional<std::string> decode_string(const std::string& hex);

    // "1500000", 6 -> "1.500000"
    std::string format_units(const std::string& decimal, unsigned decimals);
}
