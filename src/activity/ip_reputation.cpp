#include "access_guard/activity/ip_reputation.hpp"
#include "access_guard/common/constants.hpp"

namespace access_guard {
namespace activity {

PrivateRangeHeuristic::PrivateRangeHeuristic() {
    const char* ranges[] = {
        R"(^0\.0\.0\.\d{1,3}$)",
        R"(^127\.\d{1,3}\.\d{1,3}\.\d{1,3}$)",
        R"(^10\.\d{1,3}\.\d{1,3}\.\d{1,3}$)",
        R"(^172\.(1[6-9]|2\d|3[01])\.\d{1,3}\.\d{1,3}$)",
        R"(^192\.168\.\d{1,3}\.\d{1,3}$)"
    };

    for (const char* range : ranges) {
        patterns_.emplace_back(range, std::regex::ECMAScript | std::regex::optimize);
    }
}

bool PrivateRangeHeuristic::isSuspicious(const std::string& ip_address) const {
    if (ip_address.empty() || ip_address == constants::metadata_keys::UNKNOWN_VALUE) {
        return false;
    }

    for (const auto& pattern : patterns_) {
        if (std::regex_match(ip_address, pattern)) {
            return true;
        }
    }
    return false;
}

}}
