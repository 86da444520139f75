#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/events/event_bus.hpp"
#include "chanfs/naming/filename_codec.hpp"
#include "chanfs/transfer/retry.hpp"
#include "chanfs/transfer/types.hpp"
#include "chanfs/transport/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chanfs::cli {

enum class CommandKind {
    Up,
    Down,
    Remove,
    List,
    Help
};

/**
 * @brief Parsed command line
 *
 * Flags that do not apply to the chosen command are rejected by
 * parse_arguments.
 */
struct Invocation {
    CommandKind command = CommandKind::Help;
    std::vector<std::string> positional;
    bool debug = false;
    bool resume = false;
    bool force = false;
    bool verbose = false;
    std::optional<std::filesystem::path> config_path;
};

Result<Invocation> parse_arguments(int argc, const char* const argv[]);

std::string usage();

/// One logical file as seen by `ls`
struct RemoteFile {
    std::string name;
    std::string container_id;
    std::optional<std::uint64_t> size;  ///< Empty when the topic is not a size
};

/**
 * @brief The user-facing operations, run against any Transport
 *
 * Each operation resolves logical names through the container list first,
 * checks its preconditions, then hands over to the transfer engines.
 */
class Commands {
public:
    Commands(transport::Transport& remote,
             events::EventBus& bus,
             std::string guild_id,
             transfer::RetryOptions retry,
             transfer::RetryPolicy::Sleeper sleeper = {});

    /// `up <local> [remote]`; remote defaults to the local file's base name
    Result<transfer::TransferSummary> up(const std::filesystem::path& local,
                                         const std::optional<std::string>& remote_name,
                                         bool resume);

    /// `down <remote> [local]`; local defaults to the remote name
    Result<transfer::TransferSummary> down(const std::string& remote_name,
                                           const std::optional<std::filesystem::path>& local,
                                           bool force);

    Result<void> remove(const std::string& remote_name);

    Result<std::vector<RemoteFile>> list();

private:
    Result<std::vector<transport::Container>> containers();

    transport::Transport& remote_;
    events::EventBus& bus_;
    std::string guild_id_;
    transfer::RetryOptions retry_;
    transfer::RetryPolicy::Sleeper sleeper_;
};

} // namespace chanfs::cli
