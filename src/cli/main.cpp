#include "chanfs/cli/commands.hpp"
#include "chanfs/cli/config.hpp"
#include "chanfs/events/components.hpp"
#include "chanfs/events/event_bus.hpp"
#include "chanfs/transport/rest_transport.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace {

int report(const chanfs::Error& error) {
    std::cerr << "error: " << error.message << std::endl;
    return 1;
}

void setup_logging(spdlog::level::level_enum level) {
    // stdout belongs to ls output and debug progress lines
    auto logger = spdlog::stderr_color_mt("chanfs");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(level);
}

int run(int argc, char* argv[]) {
    auto parsed = chanfs::cli::parse_arguments(argc, argv);
    if (parsed.is_error()) {
        std::cerr << chanfs::cli::usage();
        return report(parsed.error());
    }
    const auto& invocation = parsed.value();
    if (invocation.command == chanfs::cli::CommandKind::Help) {
        std::cout << chanfs::cli::usage();
        return 0;
    }

    setup_logging(spdlog::level::warn);

    auto loaded = chanfs::cli::load_config(invocation.config_path);
    if (loaded.is_error()) {
        return report(loaded.error());
    }
    const auto& config = loaded.value();
    spdlog::set_level(invocation.verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

    chanfs::transport::RestTransport remote(config.rest_options());
    chanfs::events::EventBus event_bus;

    chanfs::events::LoggerComponent logger(event_bus);
    chanfs::events::MetricsComponent metrics(event_bus);
    chanfs::events::ProgressComponent progress(event_bus,
                                               invocation.debug ? chanfs::events::ProgressMode::Debug
                                                                : chanfs::events::ProgressMode::Bar);

    chanfs::cli::Commands commands(remote, event_bus, config.guild_id, config.retry_options());
    const auto& args = invocation.positional;

    switch (invocation.command) {
        case chanfs::cli::CommandKind::Up: {
            std::optional<std::string> remote_name;
            if (args.size() > 1) {
                remote_name = args[1];
            }
            auto result = commands.up(args[0], remote_name, invocation.resume);
            if (result.is_error()) {
                return report(result.error());
            }
            break;
        }

        case chanfs::cli::CommandKind::Down: {
            std::optional<std::filesystem::path> local;
            if (args.size() > 1) {
                local = args[1];
            }
            auto result = commands.down(args[0], local, invocation.force);
            if (result.is_error()) {
                return report(result.error());
            }
            break;
        }

        case chanfs::cli::CommandKind::Remove: {
            auto result = commands.remove(args[0]);
            if (result.is_error()) {
                return report(result.error());
            }
            break;
        }

        case chanfs::cli::CommandKind::List: {
            auto result = commands.list();
            if (result.is_error()) {
                return report(result.error());
            }
            for (const auto& file : result.value()) {
                const std::string size = file.size
                    ? chanfs::events::ProgressComponent::format_bytes(*file.size)
                    : std::string("?");
                std::cout << size << '\t' << file.name << '\n';
            }
            break;
        }

        case chanfs::cli::CommandKind::Help:
            break;
    }

    if (invocation.verbose) {
        metrics.print_stats();
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
