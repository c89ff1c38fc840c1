//! # Log Initialization from the Environment
//!
//! Reads the EDEN_LOG, EDEN_LOG_FILE and EDEN_LOG_FORMAT environment
//! variables to produce a LogConfig.

#include "eden/log/log.hpp"

#include <cstdlib>
#include <string>

namespace eden::log {

LogConfig config_from_env() {
    LogConfig config;

    if (const char* env_log = std::getenv("EDEN_LOG")) {
        std::string env_str = env_log;

        // If it contains '=' or ',' it's a filter spec, otherwise it's a level
        if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
            config.filter_spec = env_str;
        } else if (!env_str.empty()) {
            config.level = parse_level(env_str);
        }
    }

    if (const char* env_file = std::getenv("EDEN_LOG_FILE")) {
        config.log_file = env_file;
    }

    if (const char* env_format = std::getenv("EDEN_LOG_FORMAT")) {
        std::string fmt = env_format;
        if (fmt == "json" || fmt == "JSON") {
            config.format = LogFormat::JSON;
        }
    }

    return config;
}

} // namespace eden::log
