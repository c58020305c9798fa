#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace {

int env_int(const char* name, int fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        return n;
    }
    catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " is not an integer: " + v);
    }
}

double env_double(const char* name, double fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument(v);
        return d;
    }
    catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " is not a number: " + v);
    }
}

} // namespace

EngineConfig EngineConfig::loadFromEnv() {
    EngineConfig config;

    const char* path_env = std::getenv("ALE_DB_PATH");
    if (path_env && *path_env) config.db_path = path_env;

    config.pool_size = env_int("ALE_POOL_SIZE", config.pool_size);
    config.busy_timeout_ms = env_int("ALE_BUSY_TIMEOUT_MS", config.busy_timeout_ms);
    config.completion_threshold = env_double("ALE_COMPLETION_THRESHOLD", config.completion_threshold);

    const char* level_env = std::getenv("ALE_LOG_LEVEL");
    if (level_env && *level_env && !parse_log_level(level_env, config.log_level))
        throw std::runtime_error(std::string("ALE_LOG_LEVEL is not a log level: ") + level_env);

    config.validate();
    return config;
}

void EngineConfig::validate() const {
    if (db_path.empty())
        throw std::runtime_error("database path is empty");
    if (pool_size < 1 || pool_size > 64)
        throw std::runtime_error("pool size must be within 1..64");
    if (busy_timeout_ms < 0)
        throw std::runtime_error("busy timeout must not be negative");
    if (!(completion_threshold > 0.0 && completion_threshold <= 100.0))
        throw std::runtime_error("completion threshold must be within (0, 100]");
}
