#pragma once

#include <map>
#include <string>

namespace access_guard {
namespace compliance {

class ComplianceCollaborator {
public:
    virtual ~ComplianceCollaborator() = default;

    // access_type is the wire name of the permission being exercised.
    virtual bool validateBankDataAccess(const std::string& user_id,
                                        const std::string& account_id,
                                        const std::string& access_type) const = 0;
};

// Grants bank data access to the account's registered owner only.
class AccountOwnershipCompliance : public ComplianceCollaborator {
public:
    explicit AccountOwnershipCompliance(std::map<std::string, std::string> account_owners);

    bool validateBankDataAccess(const std::string& user_id,
                                const std::string& account_id,
                                const std::string& access_type) const override;

private:
    std::map<std::string, std::string> account_owners_;
};

}}
