#pragma once

#include <regex>
#include <string>
#include <vector>

namespace access_guard {
namespace activity {

class IpReputation {
public:
    virtual ~IpReputation() = default;
    virtual bool isSuspicious(const std::string& ip_address) const = 0;
};

// Flags loopback, private and unroutable IPv4 ranges. Stands in for a
// threat-intelligence feed.
class PrivateRangeHeuristic : public IpReputation {
public:
    PrivateRangeHeuristic();

    bool isSuspicious(const std::string& ip_address) const override;

private:
    std::vector<std::regex> patterns_;
};

}}
