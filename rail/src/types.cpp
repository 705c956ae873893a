#include "types.hpp"

const char* to_string(EndpointStatus status) {
    switch (status) {
        case EndpointStatus::Healthy: return "healthy";
        case EndpointStatus::Failing: return "failing";
        default: return "unknown";
    }
}

bool EndpointPool::contains(const std::string& url) const {
    if (url.empty()) return false;
    if (primary.url == url) return true;
    for (const auto& b : backups) {
        if (b.url == url) return true;
    }
    return false;
}

std::vector<std::string> EndpointPool::urls() const {
    std::vector<std::string> out;
    if (has_primary()) out.push_back(primary.url);
    for (const auto& b : backups) {
        out.push_back(b.url);
    }
    return out;
}
