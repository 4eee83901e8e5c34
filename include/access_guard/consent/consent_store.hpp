#pragma once

#include "../common/clock.hpp"
#include "../common/types.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace access_guard {
namespace consent {

// Consent history. The newest record for a (user, type) pair decides;
// an expired grant counts as no consent.
class ConsentStore {
public:
    explicit ConsentStore(const common::Clock& clock);

    std::string recordConsent(const std::string& user_id,
                              common::ConsentType type,
                              bool granted,
                              const std::string& ip_address,
                              const std::string& user_agent,
                              std::optional<common::Timestamp> expires_at = std::nullopt,
                              const std::string& version = "1.0");

    bool hasConsent(const std::string& user_id, common::ConsentType type) const;

    std::vector<common::ConsentRecord> records() const;
    size_t size() const;
    size_t activeCount() const;

    void restore(std::vector<common::ConsentRecord> records);

private:
    const common::Clock& clock_;
    mutable std::shared_mutex mutex_;
    std::vector<common::ConsentRecord> records_;

    bool isEffective(const common::ConsentRecord& record, common::Timestamp now) const;
};

}}
