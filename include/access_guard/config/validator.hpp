#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace access_guard {
namespace config {

// Errors block startup and `config set`; warnings are only printed.
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void fail(const std::string& message) {
        errors.push_back(message);
        is_valid = false;
    }
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);

    static bool validatePath(const std::string& path);
    static bool validatePort(uint16_t port);
    static bool validateHour(int hour);
    static bool canCreateDirectory(const std::string& path);

private:
    static void checkPaths(const common::GlobalConfig& config, ValidationResult& result);
    static void checkRbac(const common::RbacConfig& rbac, ValidationResult& result);
    static void checkMonitor(const common::MonitorConfig& monitor, ValidationResult& result);
    static void checkPolicies(const common::GlobalConfig& config, ValidationResult& result);
    static void checkStorage(const common::GlobalConfig& config, ValidationResult& result);

    static void requirePositive(ValidationResult& result, const std::string& key, int value);
    static void requireNonNegative(ValidationResult& result, const std::string& key, int value);
};

}}
