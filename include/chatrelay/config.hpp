/**
 * @file config.hpp
 * @brief Server configuration for chatrelay
 */

#ifndef CHATRELAY_CONFIG_HPP
#define CHATRELAY_CONFIG_HPP

#include "types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace chatrelay {

/**
 * Server options
 */
struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = 8741;
    std::string accounts_path = "results/accounts.json";
    std::string api_key;
    std::string upstream_base_url = UPSTREAM_BASE_URL;
    std::size_t worker_threads = 8;
    LogLevel log_level = LogLevel::Info;
    std::string log_dir;
};

/**
 * Parse a `.env`-style file into key/value pairs
 * @param path File path
 * @return Parsed entries, empty if the file cannot be opened
 */
std::map<std::string, std::string> read_env_file(const std::string& path);

/**
 * Build server options from defaults, an optional env file and the
 * process environment, later sources winning.
 * @param env_file Optional `.env`-style file
 * @return Server options
 */
ServerOptions load_server_options(const std::optional<std::string>& env_file = std::nullopt);

/**
 * Apply configuration entries onto existing options
 * @param options Options to update
 * @param entries Keys as in the process environment
 */
void apply_config_entries(ServerOptions& options, const std::map<std::string, std::string>& entries);

} // namespace chatrelay

#endif // CHATRELAY_CONFIG_HPP
