#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    std::string val = get_env(name);
    if (val.empty()) return default_val;
    if (val == "1" || val == "true" || val == "yes") return true;
    if (val == "0" || val == "false" || val == "no") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.readiness_config_path = get_env("READINESS_CONFIG");
    cfg.include_diagnostics = get_env_bool("INCLUDE_DIAGNOSTICS", false);
    cfg.include_correlations = get_env_bool("INCLUDE_CORRELATIONS", true);
    cfg.emit_wellness_update = get_env_bool("EMIT_WELLNESS_UPDATE", true);
    cfg.correlation_max_lag = get_env_int("CORRELATION_MAX_LAG", 7);

    cfg.service_name = get_env("SERVICE_NAME", "readiness");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (correlation_max_lag < 0 || correlation_max_lag > 30) {
        throw std::runtime_error("CORRELATION_MAX_LAG must be between 0 and 30");
    }

    spdlog::debug("Configuration validated successfully");
    spdlog::debug("  Override file: {}",
                  readiness_config_path.empty() ? "(none)" : readiness_config_path);
    spdlog::debug("  Diagnostics: {}, correlations: {} (max lag {})",
                  include_diagnostics, include_correlations, correlation_max_lag);
}
