/**
 * @file config.cpp
 * @brief Server configuration implementation for chatrelay
 */

#include "chatrelay/config.hpp"
#include "chatrelay/errors.hpp"
#include <cstdlib>
#include <fstream>

namespace chatrelay {

static const char* const CONFIG_KEYS[] = {
    "CHATRELAY_HOST",
    "CHATRELAY_PORT",
    "CHATRELAY_ACCOUNTS",
    "API_KEY",
    "CHATRELAY_UPSTREAM",
    "CHATRELAY_WORKERS",
    "CHATRELAY_LOG_LEVEL",
    "CHATRELAY_LOG_DIR",
};

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static long parse_number(const std::string& key, const std::string& value, long min, long max) {
    try {
        size_t used = 0;
        long parsed = std::stol(value, &used);
        if (used != value.size() || parsed < min || parsed > max) {
            throw ConfigurationError("Invalid value for " + key + ": " + value, key);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid value for " + key + ": " + value, key);
    }
}

std::map<std::string, std::string> read_env_file(const std::string& path) {
    std::map<std::string, std::string> entries;

    std::ifstream file(path);
    if (!file.is_open()) {
        return entries;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        // Remove quotes
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            value = value.substr(1);
        }
        if (!value.empty() && (value.back() == '"' || value.back() == '\'')) {
            value.pop_back();
        }
        entries[key] = value;
    }

    return entries;
}

void apply_config_entries(ServerOptions& options, const std::map<std::string, std::string>& entries) {
    for (const auto& [key, value] : entries) {
        if (key == "CHATRELAY_HOST") {
            options.host = value;
        } else if (key == "CHATRELAY_PORT") {
            options.port = static_cast<int>(parse_number(key, value, 1, 65535));
        } else if (key == "CHATRELAY_ACCOUNTS") {
            options.accounts_path = value;
        } else if (key == "API_KEY") {
            options.api_key = value;
        } else if (key == "CHATRELAY_UPSTREAM") {
            std::string url = value;
            while (!url.empty() && url.back() == '/') url.pop_back();
            options.upstream_base_url = url;
        } else if (key == "CHATRELAY_WORKERS") {
            options.worker_threads = static_cast<std::size_t>(parse_number(key, value, 1, 1024));
        } else if (key == "CHATRELAY_LOG_LEVEL") {
            options.log_level = string_to_log_level(value);
        } else if (key == "CHATRELAY_LOG_DIR") {
            options.log_dir = value;
        }
    }
}

ServerOptions load_server_options(const std::optional<std::string>& env_file) {
    ServerOptions options;

    if (env_file.has_value()) {
        apply_config_entries(options, read_env_file(*env_file));
    }

    std::map<std::string, std::string> environment;
    for (const char* key : CONFIG_KEYS) {
        const char* value = std::getenv(key);
        if (value) {
            environment[key] = value;
        }
    }
    apply_config_entries(options, environment);

    return options;
}

} // namespace chatrelay
