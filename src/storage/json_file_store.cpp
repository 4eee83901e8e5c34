#include "access_guard/storage/persistence.hpp"
#include "access_guard/storage/json_codec.hpp"
#include "access_guard/common/logger.hpp"
#include "access_guard/core/error_codes.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

namespace access_guard {
namespace storage {

namespace fs = std::filesystem;

namespace {

constexpr const char* USERS_FILE = "users.json";
constexpr const char* ACTIVITIES_FILE = "activities.json";
constexpr const char* ALERTS_FILE = "alerts.json";
constexpr const char* INCIDENTS_FILE = "incidents.json";
constexpr const char* CONSENTS_FILE = "consents.json";

fs::path tempFor(const fs::path& target) {
    fs::path temp = target;
    temp += ".tmp";
    return temp;
}

void discard(const std::vector<fs::path>& paths) {
    std::error_code ec;
    for (const auto& path : paths) {
        fs::remove(path, ec);
    }
}

// Invalid UTF-8 in free-form fields (user agents, metadata) is replaced
// rather than failing the whole checkpoint.
void writeStaged(const fs::path& temp, const nlohmann::json& document) {
    std::ofstream out(temp, std::ios::out | std::ios::trunc);
    if (!out) {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, "cannot open " + temp.string());
    }
    out << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    out.flush();
    if (!out) {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, "write " + temp.string());
    }
}

template<typename T>
std::vector<T> readCollection(const fs::path& path) {
    if (!fs::exists(path)) {
        return {};
    }

    std::ifstream in(path);
    if (!in) {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, "cannot open " + path.string());
    }

    try {
        nlohmann::json document = nlohmann::json::parse(in);
        return document.get<std::vector<T>>();
    } catch (const nlohmann::json::exception& e) {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, path.string() + ": " + e.what());
    } catch (const core::GuardError& e) {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, path.string() + ": " + e.what());
    }
}

}

JsonFileStore::JsonFileStore(std::string state_dir) : state_dir_(std::move(state_dir)) {}

void JsonFileStore::save(const StateSnapshot& state) {
    fs::path dir(state_dir_);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED,
                               "cannot create " + state_dir_ + ": " + ec.message());
    }

    const std::pair<const char*, nlohmann::json> collections[] = {
        {USERS_FILE, state.users},
        {ACTIVITIES_FILE, state.activities},
        {ALERTS_FILE, state.alerts},
        {INCIDENTS_FILE, state.incidents},
        {CONSENTS_FILE, state.consents},
    };

    // Stage every collection before replacing any, so a failed checkpoint
    // leaves the previous one intact.
    std::vector<fs::path> staged;
    try {
        for (const auto& [name, document] : collections) {
            staged.push_back(tempFor(dir / name));
            writeStaged(staged.back(), document);
        }
    } catch (const core::GuardError&) {
        discard(staged);
        throw;
    } catch (const nlohmann::json::exception& e) {
        discard(staged);
        throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED, e.what());
    }

    for (const auto& [name, document] : collections) {
        fs::path target = dir / name;
        fs::rename(tempFor(target), target, ec);
        if (ec) {
            discard(staged);
            throw core::GuardError(core::GuardErrorCode::PERSISTENCE_FAILED,
                                   "rename to " + target.string() + ": " + ec.message());
        }
    }

    common::Logger::instance().debug("[Storage] State saved | dir={} | users={} | activities={} | alerts={}",
                                     state_dir_, state.users.size(), state.activities.size(), state.alerts.size());
}

StateSnapshot JsonFileStore::load() {
    fs::path dir(state_dir_);
    StateSnapshot state;

    state.users = readCollection<common::UserAccess>(dir / USERS_FILE);
    state.activities = readCollection<common::Activity>(dir / ACTIVITIES_FILE);
    state.alerts = readCollection<common::SecurityAlert>(dir / ALERTS_FILE);
    state.incidents = readCollection<common::BreachIncident>(dir / INCIDENTS_FILE);
    state.consents = readCollection<common::ConsentRecord>(dir / CONSENTS_FILE);

    common::Logger::instance().info("[Storage] State loaded | dir={} | users={} | activities={} | alerts={} | incidents={} | consents={}",
                                    state_dir_, state.users.size(), state.activities.size(),
                                    state.alerts.size(), state.incidents.size(), state.consents.size());
    return state;
}

}}
