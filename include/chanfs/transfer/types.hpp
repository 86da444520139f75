#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chanfs::transfer {

/// Bytes reserved below the attachment limit for message framing overhead
inline constexpr std::size_t kSafetyMargin = 50;

inline constexpr std::size_t kDefaultSendAttempts = 10;

/// Channels a guild may hold
inline constexpr std::size_t kMaxContainers = 500;

enum class TransferState {
    Init,
    SingleShot,
    Chunked,
    Complete,
    Failed
};

enum class TransferDirection {
    Upload,
    Download
};

/**
 * @brief Where a resumed upload continues
 *
 * Blocks 1..last_block_index are on the remote, each block_size bytes long.
 */
struct ResumePoint {
    std::size_t block_size = 0;
    std::uint64_t last_block_index = 0;

    [[nodiscard]] std::uint64_t byte_offset() const noexcept {
        return last_block_index * block_size;
    }
};

/**
 * @brief Retry tuning shared by upload sends and download fetches
 */
struct RetryOptions {
    std::size_t max_attempts = kDefaultSendAttempts;
    std::chrono::milliseconds backoff_unit{1000};
};

struct UploadOptions {
    bool resume = false;
    std::string parent_group;  ///< Guild the container is created in
    RetryOptions retry;
};

struct DownloadOptions {
    bool overwrite = false;
    RetryOptions retry;
};

/**
 * @brief Final figures of a finished transfer
 */
struct TransferSummary {
    std::string container_id;
    std::uint64_t total_bytes = 0;
    std::uint64_t blocks_transferred = 0;
    std::size_t block_size = 0;
    bool resumed = false;
};

} // namespace chanfs::transfer
