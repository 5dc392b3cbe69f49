#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Scoring
    std::string readiness_config_path;   // optional JSON override file
    bool include_diagnostics;
    bool include_correlations;
    bool emit_wellness_update;
    int correlation_max_lag;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
