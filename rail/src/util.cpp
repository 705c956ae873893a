#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <chrono>
#include <regex>
#include <cctype>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

std::string mask_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return "***";
    }

    std::string scheme = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);

    auto query = rest.find_first_of("?#");
    if (query != std::string::npos) {
        rest = rest.substr(0, query);
    }

    auto slash = rest.find('/');
    std::string host = slash == std::string::npos ? rest : rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);

    if (host.size() > 10) {
        host = host.substr(0, 4) + "..." + host.substr(host.size() - 4);
    }

    // Path segments after the first are commonly project ids or keys
    auto second = path.find('/', 1);
    if (second != std::string::npos && second + 1 < path.size()) {
        path = path.substr(0, second) + "/***";
    }

    return scheme + "://" + host + path;
}

std::string mask_address(const std::string& address) {
    if (address.size() < 10) {
        return "***";
    }
    return address.substr(0, 6) + "..." + address.substr(address.size() - 4);
}

bool is_valid_rpc_url(const std::string& url) {
    static const std::regex pattern(R"(^https?://[^\s/?#]+(/[^\s]*)?$)", std::regex::icase);
    return std::regex_match(url, pattern);
}

bool is_valid_address(const std::string& address) {
    static const std::regex pattern("^0x[0-9a-fA-F]{40}$");
    return std::regex_match(address, pattern);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

static std::optional<uint64_t> parse_digits(const std::string& digits, int base) {
    if (digits.empty() || digits.size() > (base == 16 ? 16u : 20u)) {
        return std::nullopt;
    }
    for (char c : digits) {
        bool valid = base == 16 ? std::isxdigit(static_cast<unsigned char>(c))
                                : std::isdigit(static_cast<unsigned char>(c));
        if (!valid) return std::nullopt;
    }
    try {
        return std::stoull(digits, nullptr, base);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parse_quantity(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < 0) return std::nullopt;
        return static_cast<uint64_t>(v);
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    std::string text = value.get<std::string>();
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        return parse_digits(text.substr(2), 16);
    }
    return parse_digits(text, 10);
}

std::optional<uint64_t> parse_chain_id(const std::string& text) {
    auto id = parse_digits(text, 10);
    if (!id || *id == 0) return std::nullopt;
    return id;
}

} // namespace util
