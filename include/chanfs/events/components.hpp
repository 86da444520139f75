/**
 * @file components.hpp
 * @brief Observers attached to the transfer event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressComponent progress(bus, ProgressMode::Bar);
 * // Engines emit, components react.
 */

#pragma once

#include "chanfs/events/event_bus.hpp"
#include "chanfs/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace chanfs::events {

/**
 * @brief Logger component - logs every transfer event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] {} file={} bytes={} block_size={} offset={}{}",
                         direction_name(e.direction), e.file_name, e.total_bytes,
                         e.block_size, e.start_offset, e.resumed ? " (resumed)" : "");
        });

        bus.subscribe<BlockTransferredEvent>([](const BlockTransferredEvent& e) {
            spdlog::debug("[BlockTransferred] file={} block={} bytes={} progress={}/{}",
                          e.file_name, e.index, e.bytes, e.bytes_done, e.total_bytes);
        });

        bus.subscribe<BlockRetryEvent>([](const BlockRetryEvent& e) {
            spdlog::info("[BlockRetry] file={} block={} attempt={} wait={}ms error={}",
                         e.file_name, e.index, e.attempt, e.wait.count(), e.error);
        });

        bus.subscribe<BestEffortFailedEvent>([](const BestEffortFailedEvent& e) {
            spdlog::warn("[BestEffortFailed] file={} operation={} error={}",
                         e.file_name, e.operation, e.error);
        });

        bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] {} file={} bytes={} blocks={} duration={}ms",
                         direction_name(e.direction), e.file_name, e.total_bytes,
                         e.blocks, e.duration.count());
        });

        bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
            spdlog::error("[TransferFailed] {} file={} error={}",
                          direction_name(e.direction), e.file_name, e.error);
        });
    }
};

/**
 * @brief Metrics component - counts what went over the wire
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> blocks_uploaded{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
        std::atomic<std::uint64_t> blocks_downloaded{0};
        std::atomic<std::uint64_t> bytes_downloaded{0};
        std::atomic<std::uint64_t> retries{0};
        std::atomic<std::uint64_t> best_effort_failures{0};
        std::atomic<std::uint64_t> transfers_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<BlockTransferredEvent>([this](const BlockTransferredEvent& e) {
            if (e.direction == TransferDirection::Upload) {
                stats_.blocks_uploaded++;
                stats_.bytes_uploaded += e.bytes;
            } else {
                stats_.blocks_downloaded++;
                stats_.bytes_downloaded += e.bytes;
            }
        });

        bus.subscribe<BlockRetryEvent>([this](const BlockRetryEvent&) {
            stats_.retries++;
        });

        bus.subscribe<BestEffortFailedEvent>([this](const BestEffortFailedEvent&) {
            stats_.best_effort_failures++;
        });

        bus.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Transfer statistics:");
        spdlog::info("  Blocks uploaded:   {}", stats_.blocks_uploaded.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("  Blocks downloaded: {}", stats_.blocks_downloaded.load());
        spdlog::info("  Bytes downloaded:  {}", stats_.bytes_downloaded.load());
        spdlog::info("  Retries:           {}", stats_.retries.load());
        spdlog::info("  Skipped metadata:  {}", stats_.best_effort_failures.load());
    }

private:
    Stats stats_;
};

enum class ProgressMode {
    Bar,    ///< Human-readable bar, redrawn in place
    Debug,  ///< "<total> <processed>" line per block
    Quiet
};

/**
 * @brief Progress component - renders transfer progress
 *
 * Debug mode writes one machine-parsable line per block to `out`. Bar mode
 * redraws a single line on `bar_out` (stderr by default, so piping stdout
 * stays clean).
 */
class ProgressComponent {
public:
    static constexpr int kBarWidth = 30;

    ProgressComponent(EventBus& bus, ProgressMode mode,
                      std::ostream& out = std::cout,
                      std::ostream& bar_out = std::cerr)
        : mode_(mode), out_(out), bar_out_(bar_out) {
        bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            std::lock_guard lock(mutex_);
            label_ = std::string(e.direction == TransferDirection::Upload ? "Uploading " : "Downloading ") +
                     e.file_name;
            if (mode_ == ProgressMode::Bar) {
                draw(e.start_offset, e.total_bytes);
            }
        });

        bus.subscribe<BlockTransferredEvent>([this](const BlockTransferredEvent& e) {
            std::lock_guard lock(mutex_);
            if (mode_ == ProgressMode::Debug) {
                out_ << e.total_bytes << ' ' << e.bytes_done << '\n';
                out_.flush();
            } else if (mode_ == ProgressMode::Bar) {
                draw(e.bytes_done, e.total_bytes);
            }
        });

        bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) {
            std::lock_guard lock(mutex_);
            if (mode_ == ProgressMode::Bar) {
                bar_out_ << '\n';
                bar_out_.flush();
            }
        });

        bus.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            std::lock_guard lock(mutex_);
            if (mode_ == ProgressMode::Bar) {
                bar_out_ << '\n';
                bar_out_.flush();
            }
        });
    }

    static std::string format_bytes(std::uint64_t bytes) {
        static const char* units[] = {"B", "kB", "MB", "GB", "TB"};
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1000.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
            value /= 1000.0;
            ++unit;
        }
        std::ostringstream oss;
        if (unit == 0) {
            oss << bytes << ' ' << units[0];
        } else {
            oss << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
        }
        return oss.str();
    }

private:
    void draw(std::uint64_t done, std::uint64_t total) {
        const int percent = total == 0 ? 100 : static_cast<int>(done * 100 / total);
        const int filled = percent * kBarWidth / 100;
        bar_out_ << '\r' << label_ << ' ' << std::setw(3) << percent << "% |"
                 << std::string(static_cast<std::size_t>(filled), '#')
                 << std::string(static_cast<std::size_t>(kBarWidth - filled), ' ')
                 << "| " << format_bytes(done) << '/' << format_bytes(total);
        bar_out_.flush();
    }

    ProgressMode mode_;
    std::ostream& out_;
    std::ostream& bar_out_;
    std::string label_;
    std::mutex mutex_;
};

} // namespace chanfs::events
