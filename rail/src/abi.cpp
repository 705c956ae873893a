#include "abi.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace abi {

static std::string strip_prefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

static bool all_hex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

std::string encode_call(const std::string& selector, const std::vector<std::string>& address_args) {
    std::string data = selector;
    for (const auto& address : address_args) {
        std::string raw = util::to_lower(strip_prefix(address));
        data += std::string(64 - std::min<size_t>(64, raw.size()), '0') + raw;
    }
    return data;
}

std::optional<std::string> hex_to_decimal(const std::string& hex) {
    std::string digits = strip_prefix(hex);
    if (digits.empty() || !all_hex(digits)) {
        return std::nullopt;
    }

    // Little-endian base-10 digits
    std::vector<int> out{0};
    for (char c : digits) {
        int carry = hex_value(c);
        for (auto& d : out) {
            int v = d * 16 + carry;
            d = v % 10;
            carry = v / 10;
        }
        while (carry > 0) {
            out.push_back(carry % 10);
            carry /= 10;
        }
    }

    std::string result;
    for (auto it = out.rbegin(); it != out.rend(); ++it) {
        result.push_back(static_cast<char>('0' + *it));
    }
    auto first = result.find_first_not_of('0');
    return first == std::string::npos ? std::string("0") : result.substr(first);
}

std::optional<uint64_t> decode_small_uint(const std::string& hex) {
    std::string digits = strip_prefix(hex);
    if (digits.empty() || !all_hex(digits)) {
        return std::nullopt;
    }

    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    if (digits.size() - first > 16) return std::nullopt;

    return std::stoull(digits.substr(first), nullptr, 16);
}

static std::string bytes_from_hex(const std::string& hex) {
    std::string out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<char>(hex_value(hex[i]) * 16 + hex_value(hex[i + 1])));
    }
    return out;
}

std::optional<std::string> decode_string(const std::string& hex) {
    std::string data = strip_prefix(hex);
    if (data.empty() || data.size() % 2 != 0 || !all_hex(data)) {
        return std::nullopt;
    }

    if (data.size() == 64) {
        std::string raw = bytes_from_hex(data);
        auto end = raw.find_last_not_of('\0');
        return end == std::string::npos ? std::string() : raw.substr(0, end + 1);
    }

    if (data.size() < 128) {
        return std::nullopt;
    }

    auto offset = decode_small_uint(data.substr(0, 64));
    if (!offset || *offset % 32 != 0 || *offset > data.size()) {
        return std::nullopt;
    }

    size_t length_pos = static_cast<size_t>(*offset) * 2;
    if (length_pos + 64 > data.size()) {
        return std::nullopt;
    }

    auto length = decode_small_uint(data.substr(length_pos, 64));
    size_t body_pos = length_pos + 64;
    if (!length || *length > data.size() || body_pos + *length * 2 > data.size()) {
        return std::nullopt;
    }

    return bytes_from_hex(data.substr(body_pos, static_cast<size_t>(*length) * 2));
}

std::string format_units(const std::string& decimal, unsigned decimals) {
    if (decimals == 0) {
        return decimal;
    }

    std::string padded = decimal;
    if (padded.size() <= decimals) {
        padded = std::string(decimals + 1 - padded.size(), '0') + padded;
    }

    size_t point = padded.size() - decimals;
    return padded.substr(0, point) + "." + padded.substr(point);
}

} // namespace abi
