#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/events/event_bus.hpp"
#include "chanfs/transfer/block_codec.hpp"
#include "chanfs/transfer/retry.hpp"
#include "chanfs/transfer/session.hpp"
#include "chanfs/transfer/types.hpp"
#include "chanfs/transport/transport.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace chanfs::transfer {

/**
 * @brief What to upload and where
 *
 * For a fresh upload `existing` is empty and a container named
 * `container_name` is created. For a resumed upload `existing` is the
 * container a previous run left behind.
 */
struct UploadRequest {
    std::filesystem::path source;
    std::string display_name;    ///< Logical name used in progress and logs
    std::string container_name;  ///< Encoded name for a new container
    std::optional<transport::Container> existing;
};

/**
 * @brief Drives one file upload, block by block
 *
 * A file no larger than the attachment limit goes out as the single block
 * "1". Anything larger is cut into blocks of (limit - kSafetyMargin) bytes,
 * or of the recorded block size when resuming. Blocks are sent strictly in
 * order, one in flight, each send guarded by the retry policy. Block 1's
 * message is pinned once, on a fresh upload only.
 *
 * A failure leaves the blocks already sent on the remote; they are a valid
 * resume point.
 */
class UploadEngine {
public:
    UploadEngine(transport::Transport& remote,
                 events::EventBus& bus,
                 RetryPolicy::Sleeper sleeper = {});

    Result<TransferSummary> upload(const UploadRequest& request, const UploadOptions& options);

private:
    struct Context {
        TransferSession& session;
        const transport::Container& container;
        std::ifstream& input;
        std::uint64_t size = 0;
        bool resume = false;
        const RetryOptions& retry;
    };

    Result<transport::Container> prepare_container(const UploadRequest& request,
                                                   const UploadOptions& options,
                                                   std::uint64_t size);

    Result<void> upload_single(Context& context);

    Result<void> upload_chunked(Context& context, std::size_t block_size, std::uint64_t start_block);

    Result<transport::Message> send_block(Context& context,
                                          std::uint64_t index,
                                          const NamedAttachment& block);

    void pin_anchor(Context& context, const transport::Message& message);

    Result<TransferSummary> fail(TransferSession& session, Error error);

    transport::Transport& remote_;
    events::EventBus& bus_;
    RetryPolicy::Sleeper sleeper_;
};

} // namespace chanfs::transfer
