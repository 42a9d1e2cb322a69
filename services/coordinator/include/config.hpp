#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct CoordinatorConfig {
    int max_concurrent_agents{5};   // cap on agents working at once; 0 = no cap
    int task_timeout_minutes{60};   // 0 disables timeouts
    int health_check_interval{30};  // seconds between coordination loop passes
    std::string observability_server{"http://localhost:4000"}; // empty disables events
    int coordination_port{4001};
    std::string log_level{"INFO"};
    bool auto_assign_tasks{true};
    int max_task_retries{3};
    int message_retention_hours{24}; // 0 keeps messages forever
    std::string session_id{"coordinator"};

    std::chrono::milliseconds task_timeout() const { return std::chrono::minutes(task_timeout_minutes); }
    std::chrono::milliseconds message_retention() const { return std::chrono::hours(message_retention_hours); }
    std::chrono::milliseconds health_check_period() const { return std::chrono::seconds(health_check_interval); }
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads COORDINATOR_* variables over the defaults. Throws ConfigError on bad values.
CoordinatorConfig load_config(const EnvLookup& lookup);
CoordinatorConfig load_config_from_env();

// Applies --flag value pairs (e.g. --port 4001 --no-auto-assign). Unknown flags throw ConfigError.
void apply_cli_args(CoordinatorConfig& cfg, int argc, char** argv);

void validate_config(const CoordinatorConfig& cfg);
