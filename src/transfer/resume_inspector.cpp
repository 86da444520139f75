#include "chanfs/transfer/resume_inspector.hpp"

#include "chanfs/transfer/block_codec.hpp"

#include <spdlog/spdlog.h>

namespace chanfs::transfer {

Result<ResumePoint> ResumeInspector::inspect(const transport::Container& container,
                                             std::uint64_t local_size) const {
    if (container.topic != BlockCodec::encode_topic(local_size)) {
        return Err<ResumePoint>(ErrorCode::SizeMismatch,
                                "remote file size does not match local file size");
    }

    transport::MessageQuery oldest;
    oldest.limit = 1;
    oldest.after_id = "0";
    oldest.ascending = true;
    auto first = remote_.list_messages(container.id, oldest);
    if (first.is_error()) {
        return Err<ResumePoint>(ErrorCode::RemoteReadError,
                                "cannot list remote blocks: " + first.error().message);
    }
    if (first.value().empty() || !first.value().front().attachment) {
        return Err<ResumePoint>(ErrorCode::CannotInferBlockSize, "cannot infer block size");
    }

    const auto& anchor = *first.value().front().attachment;
    auto anchor_index = BlockCodec::parse_index(anchor.name);
    if (anchor_index.is_error() || anchor_index.value() != 1) {
        return Err<ResumePoint>(ErrorCode::CannotInferBlockSize,
                                "cannot infer block size: oldest block is '" + anchor.name + "', not 1");
    }

    const std::size_t block_size = anchor.size;
    auto limit = remote_.max_attachment_size();
    if (limit.is_error()) {
        return Err<ResumePoint>(limit.error());
    }
    if (block_size > limit.value()) {
        return Err<ResumePoint>(ErrorCode::BlockSizeExceedsLimit,
                                "inferred block size " + std::to_string(block_size) +
                                    " is larger than the largest permitted block size " +
                                    std::to_string(limit.value()));
    }
    if (block_size == 0) {
        return Err<ResumePoint>(ErrorCode::CannotInferBlockSize, "cannot infer block size");
    }

    transport::MessageQuery newest;
    newest.limit = 2;
    auto last = remote_.list_messages(container.id, newest);
    if (last.is_error()) {
        return Err<ResumePoint>(ErrorCode::RemoteReadError,
                                "cannot list remote blocks: " + last.error().message);
    }

    // The newest message may be a pin notice, hence two.
    std::uint64_t last_block_index = 0;
    for (const auto& message : last.value()) {
        if (!message.attachment) {
            continue;
        }
        if (message.attachment->size != block_size) {
            return Err<ResumePoint>(ErrorCode::IncompleteUploadFromPartialLastBlock,
                                    "complete upload inferred from incomplete last block");
        }
        auto index = BlockCodec::parse_index(message.attachment->name);
        if (index.is_error()) {
            return Err<ResumePoint>(index.error());
        }
        last_block_index = index.value();
        break;
    }
    if (last_block_index == 0) {
        return Err<ResumePoint>(ErrorCode::CannotInferBlockSize,
                                "cannot find the last block of the remote file");
    }

    ResumePoint point;
    point.block_size = block_size;
    point.last_block_index = last_block_index;

    if (point.byte_offset() == local_size) {
        return Err<ResumePoint>(ErrorCode::AlreadyComplete, "upload is already complete");
    }
    if (point.byte_offset() > local_size) {
        return Err<ResumePoint>(ErrorCode::SizeMismatch,
                                "remote blocks cover more bytes than the local file holds");
    }

    spdlog::debug("resume point for {}: block size {}, last block {}, offset {}",
                  container.name, point.block_size, point.last_block_index, point.byte_offset());
    return Ok(point);
}

} // namespace chanfs::transfer
