/**
 * @file events.hpp
 * @brief Event types emitted by the transfer engines
 *
 * NAMING CONVENTION:
 * Events are past-tense: TransferStartedEvent, BlockTransferredEvent
 */

#pragma once

#include "chanfs/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chanfs::events {

using transfer::TransferDirection;

/**
 * @brief Emitted once the engine knows the transfer geometry
 *
 * WHO SUBSCRIBES:
 * - ProgressComponent (opens the bar, pre-fills resumed bytes)
 * - LoggerComponent
 */
struct TransferStartedEvent {
    std::string file_name;
    TransferDirection direction = TransferDirection::Upload;
    std::uint64_t total_bytes = 0;
    std::size_t block_size = 0;
    std::uint64_t start_offset = 0;  ///< Bytes already on the remote (resume)
    bool resumed = false;
};

/**
 * @brief Emitted after a block was acknowledged by the remote (upload) or
 * written to the local file (download)
 */
struct BlockTransferredEvent {
    std::string file_name;
    TransferDirection direction = TransferDirection::Upload;
    std::uint64_t index = 0;
    std::size_t bytes = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t total_bytes = 0;
};

/**
 * @brief Emitted before the engine backs off and retries a block
 */
struct BlockRetryEvent {
    std::string file_name;
    std::uint64_t index = 0;
    std::size_t attempt = 0;
    std::chrono::milliseconds wait{0};
    std::string error;
};

/**
 * @brief Emitted when a best-effort call (topic, pin) failed and was skipped
 */
struct BestEffortFailedEvent {
    std::string file_name;
    std::string operation;
    std::string error;
};

struct TransferCompletedEvent {
    std::string file_name;
    TransferDirection direction = TransferDirection::Upload;
    std::uint64_t total_bytes = 0;
    std::uint64_t blocks = 0;
    std::chrono::milliseconds duration{0};
};

struct TransferFailedEvent {
    std::string file_name;
    TransferDirection direction = TransferDirection::Upload;
    std::string error;
};

inline const char* direction_name(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

} // namespace chanfs::events
