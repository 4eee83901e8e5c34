#pragma once

#include "../common/types.hpp"
#include <nlohmann/json.hpp>

namespace access_guard {
namespace common {

// nlohmann ADL hooks for the persisted domain records. Decoding throws
// nlohmann::json::exception or core::GuardError on malformed input.
void to_json(nlohmann::json& j, const UserAccess& user);
void from_json(const nlohmann::json& j, UserAccess& user);

void to_json(nlohmann::json& j, const Activity& activity);
void from_json(const nlohmann::json& j, Activity& activity);

void to_json(nlohmann::json& j, const SecurityAlert& alert);
void from_json(const nlohmann::json& j, SecurityAlert& alert);

void to_json(nlohmann::json& j, const BreachIncident& incident);
void from_json(const nlohmann::json& j, BreachIncident& incident);

void to_json(nlohmann::json& j, const ConsentRecord& record);
void from_json(const nlohmann::json& j, ConsentRecord& record);

}}
