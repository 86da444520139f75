#include "chanfs/cli/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace chanfs::cli {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<std::string> read_string(const json& document, const char* key, std::string fallback) {
    if (!document.contains(key)) {
        return Ok(std::move(fallback));
    }
    const auto& value = document[key];
    if (value.is_string()) {
        return Ok(value.get<std::string>());
    }
    // Snowflake ids are sometimes written as numbers
    if (value.is_number_unsigned()) {
        return Ok(std::to_string(value.get<std::uint64_t>()));
    }
    return Err<std::string>(ErrorCode::ConfigError, std::string("\"") + key + "\" must be a string");
}

Result<std::uint64_t> read_unsigned(const json& document, const char* key, std::uint64_t fallback) {
    if (!document.contains(key)) {
        return Ok(fallback);
    }
    const auto& value = document[key];
    if (!value.is_number_unsigned()) {
        return Err<std::uint64_t>(ErrorCode::ConfigError,
                                  std::string("\"") + key + "\" must be a non-negative integer");
    }
    return Ok(value.get<std::uint64_t>());
}

} // namespace

transport::RestOptions Config::rest_options() const {
    transport::RestOptions options;
    options.host = api_host;
    options.port = api_port;
    options.api_base = api_base;
    options.token = token;
    options.guild_id = guild_id;
    options.max_attachment_size = max_attachment_size;
    return options;
}

transfer::RetryOptions Config::retry_options() const {
    transfer::RetryOptions options;
    options.max_attempts = send_attempts;
    options.backoff_unit = backoff_unit;
    return options;
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::optional<fs::path> resolve_config_path(const std::optional<fs::path>& explicit_path,
                                            const EnvLookup& env) {
    if (explicit_path) {
        return explicit_path;
    }
    if (auto path = env("CHANFS_CONFIG")) {
        return fs::path(*path);
    }
    if (auto xdg = env("XDG_CONFIG_HOME")) {
        return fs::path(*xdg) / "chanfs" / "config.json";
    }
    if (auto home = env("HOME")) {
        return fs::path(*home) / ".config" / "chanfs" / "config.json";
    }
    return std::nullopt;
}

Result<Config> parse_config(const json& document) {
    if (!document.is_object()) {
        return Err<Config>(ErrorCode::ConfigError, "configuration must be a JSON object");
    }

    Config config;

    auto token = read_string(document, "token", config.token);
    if (token.is_error()) return Err<Config>(token.error());
    config.token = token.value();

    auto guild = read_string(document, "guild_id", config.guild_id);
    if (guild.is_error()) return Err<Config>(guild.error());
    config.guild_id = guild.value();

    auto host = read_string(document, "api_host", config.api_host);
    if (host.is_error()) return Err<Config>(host.error());
    config.api_host = host.value();

    auto base = read_string(document, "api_base", config.api_base);
    if (base.is_error()) return Err<Config>(base.error());
    config.api_base = base.value();

    auto level = read_string(document, "log_level", config.log_level);
    if (level.is_error()) return Err<Config>(level.error());
    config.log_level = level.value();
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<Config>(ErrorCode::ConfigError, "unknown log_level \"" + config.log_level + "\"");
    }

    auto port = read_unsigned(document, "api_port", config.api_port);
    if (port.is_error()) return Err<Config>(port.error());
    if (port.value() == 0 || port.value() > 65535) {
        return Err<Config>(ErrorCode::ConfigError, "\"api_port\" out of range");
    }
    config.api_port = static_cast<uint16_t>(port.value());

    if (document.contains("max_attachment_size")) {
        auto limit = read_unsigned(document, "max_attachment_size", 0);
        if (limit.is_error()) return Err<Config>(limit.error());
        config.max_attachment_size = static_cast<std::size_t>(limit.value());
    }

    auto attempts = read_unsigned(document, "send_attempts", config.send_attempts);
    if (attempts.is_error()) return Err<Config>(attempts.error());
    if (attempts.value() == 0) {
        return Err<Config>(ErrorCode::ConfigError, "\"send_attempts\" must be at least 1");
    }
    config.send_attempts = static_cast<std::size_t>(attempts.value());

    auto backoff = read_unsigned(document, "backoff_unit_ms", static_cast<std::uint64_t>(config.backoff_unit.count()));
    if (backoff.is_error()) return Err<Config>(backoff.error());
    config.backoff_unit = std::chrono::milliseconds(backoff.value());

    return Ok(config);
}

Result<Config> load_config(const std::optional<fs::path>& explicit_path, const EnvLookup& env) {
    Config config;

    const auto path = resolve_config_path(explicit_path, env);
    std::error_code ec;
    if (path && fs::exists(*path, ec)) {
        std::ifstream input(*path);
        if (!input) {
            return Err<Config>(ErrorCode::ConfigError, "cannot open config file " + path->string());
        }
        std::stringstream contents;
        contents << input.rdbuf();

        auto document = json::parse(contents.str(), nullptr, false);
        if (document.is_discarded()) {
            return Err<Config>(ErrorCode::ConfigError, "malformed JSON in " + path->string());
        }
        auto parsed = parse_config(document);
        if (parsed.is_error()) {
            return Err<Config>(ErrorCode::ConfigError,
                               path->string() + ": " + parsed.error().message);
        }
        config = parsed.value();
        spdlog::debug("loaded configuration from {}", path->string());
    } else if (explicit_path) {
        return Err<Config>(ErrorCode::ConfigError, "config file " + explicit_path->string() + " does not exist");
    }

    if (auto token = env("CHANFS_TOKEN")) {
        config.token = *token;
    }
    if (auto guild = env("CHANFS_GUILD_ID")) {
        config.guild_id = *guild;
    }

    if (config.token.empty()) {
        return Err<Config>(ErrorCode::ConfigError, "no bot token configured (set \"token\" or CHANFS_TOKEN)");
    }
    if (config.guild_id.empty()) {
        return Err<Config>(ErrorCode::ConfigError, "no guild configured (set \"guild_id\" or CHANFS_GUILD_ID)");
    }
    return Ok(config);
}

} // namespace chanfs::cli
