#include "chanfs/transfer/upload.hpp"

#include "chanfs/events/events.hpp"
#include "chanfs/transfer/block_codec.hpp"
#include "chanfs/transfer/resume_inspector.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <vector>

namespace chanfs::transfer {
namespace fs = std::filesystem;

namespace {

Result<void> verify_chunk_size(std::size_t block_size, std::size_t actual) {
    if (actual == 0) {
        return Err<void>(ErrorCode::LocalReadError, "chunk size cannot be zero");
    }
    if (actual > block_size) {
        return Err<void>(ErrorCode::LocalReadError,
                         "chunk size " + std::to_string(actual) + " exceeds maximum " +
                             std::to_string(block_size));
    }
    return Ok();
}

} // namespace

UploadEngine::UploadEngine(transport::Transport& remote,
                           events::EventBus& bus,
                           RetryPolicy::Sleeper sleeper)
    : remote_(remote),
      bus_(bus),
      sleeper_(std::move(sleeper)) {
}

Result<TransferSummary> UploadEngine::upload(const UploadRequest& request, const UploadOptions& options) {
    std::ifstream input(request.source, std::ios::binary);
    if (!input) {
        return Err<TransferSummary>(ErrorCode::LocalReadError,
                                    "cannot open " + request.source.string());
    }

    std::error_code ec;
    const auto size = fs::file_size(request.source, ec);
    if (ec) {
        return Err<TransferSummary>(ErrorCode::LocalReadError,
                                    "cannot stat " + request.source.string() + ": " + ec.message());
    }
    if (size == 0) {
        return Err<TransferSummary>(ErrorCode::InvalidArgument,
                                    "cannot upload empty file " + request.source.string());
    }

    auto limit = remote_.max_attachment_size();
    if (limit.is_error()) {
        return Err<TransferSummary>(limit.error());
    }

    const bool resume = options.resume;
    TransferSession session(request.display_name, TransferDirection::Upload, size);

    std::optional<ResumePoint> resume_point;
    if (resume) {
        if (!request.existing) {
            return Err<TransferSummary>(ErrorCode::NotFound,
                                        request.display_name + " does not exist");
        }
        auto point = ResumeInspector(remote_).inspect(*request.existing, size);
        if (point.is_error()) {
            return Err<TransferSummary>(point.error());
        }
        resume_point = point.value();
    }

    // Geometry is settled before anything is written to the remote.
    const bool single_shot = !resume && size <= limit.value();
    std::size_t block_size = 0;
    std::uint64_t start_block = 0;
    if (single_shot) {
        block_size = static_cast<std::size_t>(size);
    } else if (resume_point) {
        block_size = resume_point->block_size;
        start_block = resume_point->last_block_index;
    } else if (limit.value() <= kSafetyMargin) {
        return Err<TransferSummary>(ErrorCode::ChunkTooSmall, "calculated chunk size is too small");
    } else {
        block_size = limit.value() - kSafetyMargin;
    }

    auto container = prepare_container(request, options, size);
    if (container.is_error()) {
        return Err<TransferSummary>(container.error());
    }

    Context context{session, container.value(), input, size, resume, options.retry};

    TransferSummary summary;
    summary.container_id = container.value().id;
    summary.total_bytes = size;
    summary.block_size = block_size;
    summary.resumed = resume;

    Result<void> outcome = Ok();
    if (single_shot) {
        if (auto step = session.transition_to(TransferState::SingleShot); step.is_error()) {
            return fail(session, step.error());
        }
        outcome = upload_single(context);
    } else {
        if (auto step = session.transition_to(TransferState::Chunked); step.is_error()) {
            return fail(session, step.error());
        }
        outcome = upload_chunked(context, block_size, start_block);
    }

    if (outcome.is_error()) {
        return fail(session, outcome.error());
    }
    if (auto step = session.transition_to(TransferState::Complete); step.is_error()) {
        return fail(session, step.error());
    }

    // Blocks found on the remote at resume time were not sent by this run
    summary.blocks_transferred = session.info().blocks_done - start_block;
    bus_.emit(events::TransferCompletedEvent{request.display_name, TransferDirection::Upload,
                                             size, session.info().blocks_done, session.elapsed()});
    return Ok(summary);
}

Result<transport::Container> UploadEngine::prepare_container(const UploadRequest& request,
                                                             const UploadOptions& options,
                                                             std::uint64_t size) {
    if (options.resume) {
        return Ok(*request.existing);
    }

    auto created = remote_.create_container(request.container_name, options.parent_group);
    if (created.is_error()) {
        return Err<transport::Container>(ErrorCode::RemoteWriteError,
                                         "cannot create remote file: " + created.error().message);
    }

    auto container = created.value();
    container.topic = BlockCodec::encode_topic(size);

    // Best effort: resume is refused later if the topic never landed.
    auto topic = remote_.set_container_topic(container.id, container.topic);
    if (topic.is_error()) {
        bus_.emit(events::BestEffortFailedEvent{request.display_name, "set topic", topic.error().message});
    }
    return Ok(container);
}

Result<void> UploadEngine::upload_single(Context& context) {
    bus_.emit(events::TransferStartedEvent{context.session.file_name(), TransferDirection::Upload,
                                           context.size, static_cast<std::size_t>(context.size), 0,
                                           context.resume});

    std::vector<std::uint8_t> payload(static_cast<std::size_t>(context.size));
    context.input.read(reinterpret_cast<char*>(payload.data()),
                       static_cast<std::streamsize>(payload.size()));
    if (context.input.bad() || static_cast<std::uint64_t>(context.input.gcount()) != context.size) {
        return Err<void>(ErrorCode::LocalReadError,
                         "failed to read file " + context.session.file_name());
    }

    const auto block = BlockCodec::encode(1, std::move(payload));
    auto message = send_block(context, 1, block);
    if (message.is_error()) {
        return Err<void>(message.error());
    }
    if (!context.resume) {
        pin_anchor(context, message.value());
    }

    context.session.record_block(block.payload.size());
    bus_.emit(events::BlockTransferredEvent{context.session.file_name(), TransferDirection::Upload, 1,
                                            block.payload.size(), context.size, context.size});
    return Ok();
}

Result<void> UploadEngine::upload_chunked(Context& context, std::size_t block_size, std::uint64_t start_block) {
    const std::uint64_t start_offset = start_block * block_size;
    context.input.seekg(static_cast<std::streamoff>(start_offset));
    if (!context.input) {
        return Err<void>(ErrorCode::LocalReadError,
                         "cannot seek to offset " + std::to_string(start_offset) + " in " +
                             context.session.file_name());
    }
    context.session.skip_ahead(start_block, start_offset);

    bus_.emit(events::TransferStartedEvent{context.session.file_name(), TransferDirection::Upload,
                                           context.size, block_size, start_offset, context.resume});

    bool first = !context.resume;
    std::uint64_t block_number = start_block;
    std::uint64_t offset = start_offset;

    for (;;) {
        ++block_number;

        // Fresh buffer per block: the retried send owns exactly these bytes.
        std::vector<std::uint8_t> buffer(block_size);
        context.input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(block_size));
        if (context.input.bad()) {
            return Err<void>(ErrorCode::LocalReadError,
                             "failed to read chunk " + std::to_string(block_number));
        }
        const auto bytes_read = static_cast<std::size_t>(context.input.gcount());
        if (bytes_read == 0) {
            break;
        }

        if (auto check = verify_chunk_size(block_size, bytes_read); check.is_error()) {
            return Err<void>(check.error().code,
                             "chunk " + std::to_string(block_number) + " validation failed: " +
                                 check.error().message);
        }
        buffer.resize(bytes_read);

        const auto block = BlockCodec::encode(block_number, std::move(buffer));
        auto message = send_block(context, block_number, block);
        if (message.is_error()) {
            return Err<void>(message.error());
        }
        if (first) {
            pin_anchor(context, message.value());
            first = false;
        }

        offset += bytes_read;
        context.session.record_block(bytes_read);
        bus_.emit(events::BlockTransferredEvent{context.session.file_name(), TransferDirection::Upload,
                                                block_number, bytes_read, offset, context.size});

        if (bytes_read < block_size) {
            break;
        }
    }

    if (offset != context.size) {
        return Err<void>(ErrorCode::LocalReadError,
                         "local file changed during upload: sent " + std::to_string(offset) +
                             " of " + std::to_string(context.size) + " bytes");
    }
    return Ok();
}

Result<transport::Message> UploadEngine::send_block(Context& context,
                                                    std::uint64_t index,
                                                    const NamedAttachment& block) {
    const std::string& file_name = context.session.file_name();

    RetryPolicy retry(context.retry, sleeper_);
    retry.set_observer([&](std::size_t attempt, std::chrono::milliseconds wait, const Error& error) {
        bus_.emit(events::BlockRetryEvent{file_name, index, attempt, wait, error.message});
    });

    return retry.run("upload of block " + block.name, [&] {
        return remote_.send_message(context.container.id, block.name, block.payload);
    });
}

void UploadEngine::pin_anchor(Context& context, const transport::Message& message) {
    // Best effort: the pin only marks the file's first block for humans.
    auto pinned = remote_.pin_message(context.container.id, message.id);
    if (pinned.is_error()) {
        bus_.emit(events::BestEffortFailedEvent{context.session.file_name(), "pin anchor",
                                                pinned.error().message});
    }
}

Result<TransferSummary> UploadEngine::fail(TransferSession& session, Error error) {
    // mark_failed cannot be rejected from a non-terminal state
    (void)session.mark_failed(error.message);
    bus_.emit(events::TransferFailedEvent{session.file_name(), TransferDirection::Upload, error.message});
    return Err<TransferSummary>(std::move(error));
}

} // namespace chanfs::transfer
