#pragma once

#include "../common/types.hpp"
#include <string>
#include <vector>

namespace access_guard {
namespace storage {

struct StateSnapshot {
    std::vector<common::UserAccess> users;
    std::vector<common::Activity> activities;
    std::vector<common::SecurityAlert> alerts;
    std::vector<common::BreachIncident> incidents;
    std::vector<common::ConsentRecord> consents;
};

class PersistenceLayer {
public:
    virtual ~PersistenceLayer() = default;

    // Both throw core::GuardError(PERSISTENCE_FAILED) on I/O or decode errors.
    virtual void save(const StateSnapshot& state) = 0;
    virtual StateSnapshot load() = 0;
};

// One JSON array per collection under a state directory. Writes go to a
// temporary file that is renamed over the previous version.
class JsonFileStore : public PersistenceLayer {
public:
    explicit JsonFileStore(std::string state_dir);

    void save(const StateSnapshot& state) override;
    StateSnapshot load() override;

    const std::string& stateDir() const { return state_dir_; }

private:
    std::string state_dir_;
};

}}
