#pragma once

#include "access_guard/compliance/compliance.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace access_guard::tests {

/**
 * @brief Compliance collaborator with a fixed answer that remembers every query
 */
class FakeCompliance : public compliance::ComplianceCollaborator {
public:
    struct Query {
        std::string user_id;
        std::string account_id;
        std::string access_type;
    };

    explicit FakeCompliance(bool allow = true) : allow_(allow) {}

    void setAllow(bool allow) { allow_ = allow; }
    void setThrows(bool throws) { throws_ = throws; }

    const std::vector<Query>& queries() const { return queries_; }

    bool validateBankDataAccess(const std::string& user_id,
                                const std::string& account_id,
                                const std::string& access_type) const override {
        queries_.push_back({user_id, account_id, access_type});
        if (throws_) {
            throw std::runtime_error("compliance backend unavailable");
        }
        return allow_;
    }

private:
    bool allow_;
    bool throws_ = false;
    mutable std::vector<Query> queries_;
};

} // namespace access_guard::tests
