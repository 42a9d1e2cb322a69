#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {
int parse_int(const std::string& key, const std::string& v) {
    try {
        std::size_t pos = 0;
        int n = std::stoi(v, &pos);
        if (pos != v.size()) throw ConfigError(key + ": not an integer: " + v);
        return n;
    } catch (const std::invalid_argument&) {
        throw ConfigError(key + ": not an integer: " + v);
    } catch (const std::out_of_range&) {
        throw ConfigError(key + ": out of range: " + v);
    }
}

bool parse_bool(const std::string& key, const std::string& v) {
    std::string n = v;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (n == "1" || n == "true" || n == "yes" || n == "on") return true;
    if (n == "0" || n == "false" || n == "no" || n == "off") return false;
    throw ConfigError(key + ": not a boolean: " + v);
}
}

CoordinatorConfig load_config(const EnvLookup& lookup) {
    CoordinatorConfig cfg;
    auto get = [&](const char* key) { return lookup(key); };
    if (auto v = get("COORDINATOR_MAX_CONCURRENT_AGENTS")) cfg.max_concurrent_agents = parse_int("max_concurrent_agents", *v);
    if (auto v = get("COORDINATOR_TASK_TIMEOUT_MINUTES")) cfg.task_timeout_minutes = parse_int("task_timeout_minutes", *v);
    if (auto v = get("COORDINATOR_HEALTH_CHECK_INTERVAL")) cfg.health_check_interval = parse_int("health_check_interval", *v);
    if (auto v = get("COORDINATOR_OBSERVABILITY_SERVER")) cfg.observability_server = *v;
    if (auto v = get("COORDINATOR_PORT")) cfg.coordination_port = parse_int("coordination_port", *v);
    if (auto v = get("COORDINATOR_LOG_LEVEL")) cfg.log_level = *v;
    if (auto v = get("COORDINATOR_AUTO_ASSIGN_TASKS")) cfg.auto_assign_tasks = parse_bool("auto_assign_tasks", *v);
    if (auto v = get("COORDINATOR_MAX_TASK_RETRIES")) cfg.max_task_retries = parse_int("max_task_retries", *v);
    if (auto v = get("COORDINATOR_MESSAGE_RETENTION_HOURS")) cfg.message_retention_hours = parse_int("message_retention_hours", *v);
    if (auto v = get("COORDINATOR_SESSION_ID")) cfg.session_id = *v;
    validate_config(cfg);
    return cfg;
}

CoordinatorConfig load_config_from_env() {
    return load_config([](const char* key) -> std::optional<std::string> {
        const char* v = std::getenv(key);
        if (!v) return std::nullopt;
        return std::string(v);
    });
}

void apply_cli_args(CoordinatorConfig& cfg, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError(a + ": missing value");
            return argv[++i];
        };
        if (a == "--port") cfg.coordination_port = parse_int("coordination_port", next());
        else if (a == "--observability") cfg.observability_server = next();
        else if (a == "--max-agents") cfg.max_concurrent_agents = parse_int("max_concurrent_agents", next());
        else if (a == "--timeout-minutes") cfg.task_timeout_minutes = parse_int("task_timeout_minutes", next());
        else if (a == "--health-interval") cfg.health_check_interval = parse_int("health_check_interval", next());
        else if (a == "--max-retries") cfg.max_task_retries = parse_int("max_task_retries", next());
        else if (a == "--retention-hours") cfg.message_retention_hours = parse_int("message_retention_hours", next());
        else if (a == "--log-level") cfg.log_level = next();
        else if (a == "--session") cfg.session_id = next();
        else if (a == "--no-auto-assign") cfg.auto_assign_tasks = false;
        else if (a == "--auto-assign") cfg.auto_assign_tasks = true;
        else throw ConfigError("unknown option: " + a);
    }
    validate_config(cfg);
}

void validate_config(const CoordinatorConfig& cfg) {
    if (cfg.max_concurrent_agents < 0) throw ConfigError("max_concurrent_agents must be >= 0");
    if (cfg.task_timeout_minutes < 0) throw ConfigError("task_timeout_minutes must be >= 0");
    if (cfg.health_check_interval < 1) throw ConfigError("health_check_interval must be >= 1");
    if (cfg.coordination_port < 1 || cfg.coordination_port > 65535) throw ConfigError("coordination_port out of range");
    if (cfg.max_task_retries < 1) throw ConfigError("max_task_retries must be >= 1");
    if (cfg.message_retention_hours < 0) throw ConfigError("message_retention_hours must be >= 0");
    if (!parse_log_level(cfg.log_level)) throw ConfigError("unknown log_level: " + cfg.log_level);
}
