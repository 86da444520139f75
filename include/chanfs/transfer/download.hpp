#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/events/event_bus.hpp"
#include "chanfs/transfer/block_codec.hpp"
#include "chanfs/transfer/retry.hpp"
#include "chanfs/transfer/types.hpp"
#include "chanfs/transport/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chanfs::transfer {

/**
 * @brief A block located on the remote, ready to be fetched
 */
struct RemoteBlock {
    BlockInfo info;
    transport::Attachment attachment;
};

/**
 * @brief Verified block layout of a remote file
 */
struct BlockLayout {
    std::uint64_t total_bytes = 0;
    std::size_t block_size = 0;
    std::vector<RemoteBlock> blocks;
};

/**
 * @brief Reassembles a remote file from its blocks
 *
 * The whole layout is verified before the first byte is fetched: indices
 * contiguous from 1, every block but the last exactly block 1's size, the
 * last one non-empty and not larger, and the sum equal to the topic. An
 * interrupted upload is reported as IncompleteUpload instead of producing a
 * truncated file.
 *
 * Bytes go to "<destination>.part", renamed onto the destination once every
 * block is written.
 */
class DownloadEngine {
public:
    DownloadEngine(transport::Transport& remote,
                   events::EventBus& bus,
                   RetryPolicy::Sleeper sleeper = {});

    Result<TransferSummary> download(const transport::Container& container,
                                     const std::string& display_name,
                                     const std::filesystem::path& destination,
                                     const DownloadOptions& options);

    /// Lists and verifies the blocks of `container` without fetching them
    Result<BlockLayout> read_layout(const transport::Container& container);

    static constexpr std::size_t kPageSize = 100;

private:
    Result<std::vector<transport::Message>> list_all(const std::string& container_id);

    transport::Transport& remote_;
    events::EventBus& bus_;
    RetryPolicy::Sleeper sleeper_;
};

} // namespace chanfs::transfer
