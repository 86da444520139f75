#include "chanfs/cli/commands.hpp"

#include "chanfs/transfer/block_codec.hpp"
#include "chanfs/transfer/download.hpp"
#include "chanfs/transfer/upload.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace chanfs::cli {
namespace fs = std::filesystem;

namespace {

Result<CommandKind> command_from_string(const std::string& word) {
    if (word == "up") return Ok(CommandKind::Up);
    if (word == "down") return Ok(CommandKind::Down);
    if (word == "rm") return Ok(CommandKind::Remove);
    if (word == "ls") return Ok(CommandKind::List);
    if (word == "help") return Ok(CommandKind::Help);
    return Err<CommandKind>(ErrorCode::InvalidArgument, "unknown command \"" + word + "\"");
}

} // namespace

Result<Invocation> parse_arguments(int argc, const char* const argv[]) {
    Invocation invocation;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            invocation.command = CommandKind::Help;
            return Ok(invocation);
        } else if (arg == "-v" || arg == "--verbose") {
            invocation.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return Err<Invocation>(ErrorCode::InvalidArgument, arg + " requires a path");
            }
            invocation.config_path = fs::path(argv[++i]);
        } else if (arg == "-d" || arg == "--debug") {
            invocation.debug = true;
        } else if (arg == "-r" || arg == "--resume") {
            invocation.resume = true;
        } else if (arg == "-f" || arg == "--force") {
            invocation.force = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Err<Invocation>(ErrorCode::InvalidArgument, "unknown option " + arg);
        } else if (!have_command) {
            auto command = command_from_string(arg);
            if (command.is_error()) {
                return Err<Invocation>(command.error());
            }
            invocation.command = command.value();
            have_command = true;
        } else {
            invocation.positional.push_back(arg);
        }
    }

    const auto count = invocation.positional.size();
    switch (invocation.command) {
        case CommandKind::Up:
            if (count < 1 || count > 2) {
                return Err<Invocation>(ErrorCode::InvalidArgument, "up requires <local file> [remote file]");
            }
            if (invocation.force) {
                return Err<Invocation>(ErrorCode::InvalidArgument, "--force only applies to down");
            }
            break;
        case CommandKind::Down:
            if (count < 1 || count > 2) {
                return Err<Invocation>(ErrorCode::InvalidArgument, "down requires <remote file> [local file]");
            }
            if (invocation.resume) {
                return Err<Invocation>(ErrorCode::InvalidArgument, "--resume only applies to up");
            }
            break;
        case CommandKind::Remove:
            if (count != 1) {
                return Err<Invocation>(ErrorCode::InvalidArgument, "rm requires one argument");
            }
            break;
        case CommandKind::List:
            if (count != 0) {
                return Err<Invocation>(ErrorCode::InvalidArgument, "ls takes no arguments");
            }
            break;
        case CommandKind::Help:
            break;
    }

    if (invocation.command != CommandKind::Up && invocation.command != CommandKind::Down &&
        (invocation.debug || invocation.resume || invocation.force)) {
        return Err<Invocation>(ErrorCode::InvalidArgument, "transfer flags only apply to up and down");
    }
    return Ok(invocation);
}

std::string usage() {
    std::ostringstream oss;
    oss << "Usage: chanfs [-c|--config <path>] [-v|--verbose] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  up <local file> [remote file] [-d|--debug] [-r|--resume]   Upload file\n"
        << "  down <remote file> [local file] [-d|--debug] [-f|--force]  Download file\n"
        << "  rm <remote file>                                           Remove file\n"
        << "  ls                                                         List files\n";
    return oss.str();
}

Commands::Commands(transport::Transport& remote,
                   events::EventBus& bus,
                   std::string guild_id,
                   transfer::RetryOptions retry,
                   transfer::RetryPolicy::Sleeper sleeper)
    : remote_(remote),
      bus_(bus),
      guild_id_(std::move(guild_id)),
      retry_(retry),
      sleeper_(std::move(sleeper)) {
}

Result<std::vector<transport::Container>> Commands::containers() {
    auto listed = remote_.list_containers(guild_id_);
    if (listed.is_error()) {
        return Err<std::vector<transport::Container>>(ErrorCode::RemoteReadError,
                                                      "cannot list remote files: " + listed.error().message);
    }
    return listed;
}

Result<transfer::TransferSummary> Commands::up(const fs::path& local,
                                               const std::optional<std::string>& remote_name,
                                               bool resume) {
    auto listed = containers();
    if (listed.is_error()) {
        return Err<transfer::TransferSummary>(listed.error());
    }

    if (!resume && listed.value().size() >= transfer::kMaxContainers) {
        return Err<transfer::TransferSummary>(ErrorCode::ContainerLimitReached,
                                              "max channel limit of " +
                                                  std::to_string(transfer::kMaxContainers) + " is reached");
    }

    const std::string name = remote_name ? *remote_name : local.filename().string();
    auto encoded = naming::FilenameCodec::encode(name);
    if (encoded.is_error()) {
        return Err<transfer::TransferSummary>(encoded.error());
    }

    const auto files = naming::build_file_map(listed.value());
    const auto found = files.find(name);
    if (found != files.end() && !resume) {
        return Err<transfer::TransferSummary>(ErrorCode::AlreadyExists, name + " already exists");
    }
    if (found == files.end() && resume) {
        return Err<transfer::TransferSummary>(ErrorCode::NotFound, name + " does not exist");
    }

    transfer::UploadRequest request;
    request.source = local;
    request.display_name = name;
    request.container_name = encoded.value();
    if (found != files.end()) {
        request.existing = found->second;
    }

    transfer::UploadOptions options;
    options.resume = resume;
    options.parent_group = guild_id_;
    options.retry = retry_;

    transfer::UploadEngine engine(remote_, bus_, sleeper_);
    return engine.upload(request, options);
}

Result<transfer::TransferSummary> Commands::down(const std::string& remote_name,
                                                 const std::optional<fs::path>& local,
                                                 bool force) {
    auto listed = containers();
    if (listed.is_error()) {
        return Err<transfer::TransferSummary>(listed.error());
    }

    const auto files = naming::build_file_map(listed.value());
    const auto found = files.find(remote_name);
    if (found == files.end()) {
        return Err<transfer::TransferSummary>(ErrorCode::NotFound, remote_name + " not found");
    }

    // Remote names may contain '/', the default target is only the last part
    const fs::path destination = local ? *local : fs::path(remote_name).filename();
    if (destination.empty()) {
        return Err<transfer::TransferSummary>(ErrorCode::InvalidArgument,
                                              "cannot derive a local name from " + remote_name);
    }

    transfer::DownloadOptions options;
    options.overwrite = force;
    options.retry = retry_;

    transfer::DownloadEngine engine(remote_, bus_, sleeper_);
    return engine.download(found->second, remote_name, destination, options);
}

Result<void> Commands::remove(const std::string& remote_name) {
    auto listed = containers();
    if (listed.is_error()) {
        return Err<void>(listed.error());
    }

    const auto files = naming::build_file_map(listed.value());
    const auto found = files.find(remote_name);
    if (found == files.end()) {
        return Err<void>(ErrorCode::NotFound, remote_name + " not found");
    }

    auto deleted = remote_.delete_container(found->second.id);
    if (deleted.is_error()) {
        return Err<void>(ErrorCode::RemoteWriteError, "cannot delete file: " + deleted.error().message);
    }
    spdlog::info("removed {} (container {})", remote_name, found->second.id);
    return Ok();
}

Result<std::vector<RemoteFile>> Commands::list() {
    auto listed = containers();
    if (listed.is_error()) {
        return Err<std::vector<RemoteFile>>(listed.error());
    }

    std::vector<RemoteFile> files;
    for (const auto& [name, container] : naming::build_file_map(listed.value())) {
        RemoteFile file;
        file.name = name;
        file.container_id = container.id;
        auto size = transfer::BlockCodec::decode_topic(container.topic);
        if (size.is_ok()) {
            file.size = size.value();
        }
        files.push_back(std::move(file));
    }
    return Ok(std::move(files));
}

} // namespace chanfs::cli
