//! # Log Initialization from Arguments
//!
//! Turns logging-related command-line arguments and the SIFT_LOG environment
//! variable into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace sift::log {

namespace {

/// Counts a flag of the form -v, -vv, -vvv. Returns 0 for anything else.
int verbosity_of(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return 0;
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v')
            return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

std::string read_env(const char* name) {
#ifdef _WIN32
    std::string value;
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

} // namespace

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    bool has_level = false;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_level = true;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_of(arg));
        }
    }

    // An explicit --log-level wins over -v
    if (!has_level && verbosity > 0) {
        if (verbosity >= 3) {
            config.level = LogLevel::Trace;
        } else if (verbosity == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_level = true;
    }

    if (!has_level && !has_filter) {
        std::string env = read_env("SIFT_LOG");
        if (!env.empty()) {
            // "dce=trace,*=warn" or "dce,liveness" are filters; anything else is a level
            if (env.find('=') != std::string::npos || env.find(',') != std::string::npos) {
                config.filter_spec = env;
            } else {
                config.level = parse_level(env);
            }
        }
    }

    return config;
}

} // namespace sift::log
