#include "access_guard/consent/consent_store.hpp"
#include "access_guard/common/logger.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace access_guard {
namespace consent {

ConsentStore::ConsentStore(const common::Clock& clock) : clock_(clock) {}

std::string ConsentStore::recordConsent(const std::string& user_id,
                                        common::ConsentType type,
                                        bool granted,
                                        const std::string& ip_address,
                                        const std::string& user_agent,
                                        std::optional<common::Timestamp> expires_at,
                                        const std::string& version) {
    common::ConsentRecord record;
    record.granted_at = clock_.now();
    record.consent_id = common::generateId("consent", record.granted_at);
    record.user_id = user_id;
    record.consent_type = type;
    record.granted = granted;
    record.expires_at = expires_at;
    record.version = version;
    record.ip_address = ip_address;
    record.user_agent = user_agent;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        records_.push_back(record);
    }

    common::Logger::instance().info("[Consent] Recorded | id={} | user={} | type={} | granted={}",
                                    record.consent_id, user_id, common::to_string(type), granted);
    return record.consent_id;
}

bool ConsentStore::isEffective(const common::ConsentRecord& record, common::Timestamp now) const {
    if (!record.granted) {
        return false;
    }
    return !record.expires_at || *record.expires_at > now;
}

bool ConsentStore::hasConsent(const std::string& user_id, common::ConsentType type) const {
    common::Timestamp now = clock_.now();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->user_id == user_id && it->consent_type == type) {
            return isEffective(*it, now);
        }
    }
    return false;
}

std::vector<common::ConsentRecord> ConsentStore::records() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_;
}

size_t ConsentStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

size_t ConsentStore::activeCount() const {
    common::Timestamp now = clock_.now();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::pair<std::string, common::ConsentType>, const common::ConsentRecord*> latest;
    for (const auto& record : records_) {
        latest[{record.user_id, record.consent_type}] = &record;
    }

    size_t active = 0;
    for (const auto& entry : latest) {
        if (isEffective(*entry.second, now)) {
            ++active;
        }
    }
    return active;
}

void ConsentStore::restore(std::vector<common::ConsentRecord> records) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_ = std::move(records);
}

}}
