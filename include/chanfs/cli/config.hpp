#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transfer/types.hpp"
#include "chanfs/transport/rest_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace chanfs::cli {

/**
 * @brief Settings the command line runs with
 *
 * Read from a JSON file, then overridden by CHANFS_TOKEN / CHANFS_GUILD_ID.
 */
struct Config {
    std::string token;
    std::string guild_id;
    std::string api_host = "127.0.0.1";
    uint16_t api_port = 80;
    std::string api_base = "/api/v10";
    std::optional<std::size_t> max_attachment_size;
    std::size_t send_attempts = transfer::kDefaultSendAttempts;
    std::chrono::milliseconds backoff_unit{1000};
    std::string log_level = "warn";

    transport::RestOptions rest_options() const;
    transfer::RetryOptions retry_options() const;
};

/// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_environment();

/**
 * @brief First candidate config path: explicit, $CHANFS_CONFIG,
 * $XDG_CONFIG_HOME/chanfs/config.json, then ~/.config/chanfs/config.json
 */
std::optional<std::filesystem::path> resolve_config_path(const std::optional<std::filesystem::path>& explicit_path,
                                                         const EnvLookup& env);

Result<Config> parse_config(const nlohmann::json& document);

/**
 * @brief Loads the configuration
 *
 * An explicitly named file must exist. An implicit one may be missing, as
 * long as the environment provides the token and guild id.
 */
Result<Config> load_config(const std::optional<std::filesystem::path>& explicit_path,
                           const EnvLookup& env = process_environment());

} // namespace chanfs::cli
