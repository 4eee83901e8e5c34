#include "access_guard/compliance/compliance.hpp"
#include "access_guard/common/logger.hpp"

namespace access_guard {
namespace compliance {

AccountOwnershipCompliance::AccountOwnershipCompliance(std::map<std::string, std::string> account_owners)
    : account_owners_(std::move(account_owners)) {}

bool AccountOwnershipCompliance::validateBankDataAccess(const std::string& user_id,
                                                        const std::string& account_id,
                                                        const std::string& access_type) const {
    auto it = account_owners_.find(account_id);
    if (it == account_owners_.end()) {
        common::Logger::instance().debug("[Compliance] Unknown account | account={} | user={} | access={}",
                                         account_id, user_id, access_type);
        return false;
    }
    return it->second == user_id;
}

}}
