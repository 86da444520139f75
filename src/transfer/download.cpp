#include "chanfs/transfer/download.hpp"

#include "chanfs/events/events.hpp"
#include "chanfs/transfer/session.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace chanfs::transfer {
namespace fs = std::filesystem;

DownloadEngine::DownloadEngine(transport::Transport& remote,
                               events::EventBus& bus,
                               RetryPolicy::Sleeper sleeper)
    : remote_(remote),
      bus_(bus),
      sleeper_(std::move(sleeper)) {
}

Result<std::vector<transport::Message>> DownloadEngine::list_all(const std::string& container_id) {
    std::vector<transport::Message> all;
    transport::MessageQuery query;
    query.limit = kPageSize;
    query.after_id = "0";
    query.ascending = true;

    for (;;) {
        auto page = remote_.list_messages(container_id, query);
        if (page.is_error()) {
            return Err<std::vector<transport::Message>>(ErrorCode::RemoteReadError,
                                                        "cannot list remote blocks: " + page.error().message);
        }
        auto& messages = page.value();
        if (messages.empty()) {
            break;
        }
        query.after_id = messages.back().id;
        const bool last_page = messages.size() < query.limit;
        all.insert(all.end(), std::make_move_iterator(messages.begin()),
                   std::make_move_iterator(messages.end()));
        if (last_page) {
            break;
        }
    }
    return Ok(std::move(all));
}

Result<BlockLayout> DownloadEngine::read_layout(const transport::Container& container) {
    auto total = BlockCodec::decode_topic(container.topic);
    if (total.is_error()) {
        return Err<BlockLayout>(total.error());
    }

    auto messages = list_all(container.id);
    if (messages.is_error()) {
        return Err<BlockLayout>(messages.error());
    }

    BlockLayout layout;
    layout.total_bytes = total.value();

    for (const auto& message : messages.value()) {
        // Platform notices (pins) carry no attachment.
        if (!message.attachment) {
            continue;
        }
        auto info = BlockCodec::decode(*message.attachment);
        if (info.is_error()) {
            return Err<BlockLayout>(info.error());
        }
        const std::uint64_t expected = layout.blocks.size() + 1;
        if (info.value().index != expected) {
            return Err<BlockLayout>(ErrorCode::BlockSequenceGap,
                                    "expected block " + std::to_string(expected) + ", found block " +
                                        std::to_string(info.value().index));
        }
        layout.blocks.push_back(RemoteBlock{info.value(), *message.attachment});
    }

    if (layout.blocks.empty()) {
        if (layout.total_bytes == 0) {
            return Ok(std::move(layout));
        }
        return Err<BlockLayout>(ErrorCode::IncompleteUpload, "remote file has no blocks");
    }

    layout.block_size = layout.blocks.front().info.payload_size;
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < layout.blocks.size(); ++i) {
        const auto& info = layout.blocks[i].info;
        const bool last = i + 1 == layout.blocks.size();
        const bool valid = last ? (info.payload_size > 0 && info.payload_size <= layout.block_size)
                                : info.payload_size == layout.block_size;
        if (!valid) {
            return Err<BlockLayout>(ErrorCode::BlockSizeInconsistent,
                                    "block " + std::to_string(info.index) + " has " +
                                        std::to_string(info.payload_size) + " bytes, block size is " +
                                        std::to_string(layout.block_size));
        }
        sum += info.payload_size;
    }

    if (sum < layout.total_bytes) {
        return Err<BlockLayout>(ErrorCode::IncompleteUpload,
                                "remote file is incomplete: " + std::to_string(sum) + " of " +
                                    std::to_string(layout.total_bytes) + " bytes uploaded");
    }
    if (sum > layout.total_bytes) {
        return Err<BlockLayout>(ErrorCode::SizeMismatch,
                                "remote blocks hold " + std::to_string(sum) + " bytes, expected " +
                                    std::to_string(layout.total_bytes));
    }
    return Ok(std::move(layout));
}

Result<TransferSummary> DownloadEngine::download(const transport::Container& container,
                                                 const std::string& display_name,
                                                 const fs::path& destination,
                                                 const DownloadOptions& options) {
    std::error_code ec;
    if (!options.overwrite && fs::exists(destination, ec)) {
        return Err<TransferSummary>(ErrorCode::LocalWriteError,
                                    destination.string() + " already exists");
    }

    auto layout_result = read_layout(container);
    if (layout_result.is_error()) {
        return Err<TransferSummary>(layout_result.error());
    }
    const auto& layout = layout_result.value();

    TransferSession session(display_name, TransferDirection::Download, layout.total_bytes);
    auto fail = [&](Error error, const fs::path& partial) {
        std::error_code remove_ec;
        fs::remove(partial, remove_ec);
        (void)session.mark_failed(error.message);
        bus_.emit(events::TransferFailedEvent{display_name, TransferDirection::Download, error.message});
        return Err<TransferSummary>(std::move(error));
    };

    const fs::path partial = destination.string() + ".part";
    std::ofstream output(partial, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<TransferSummary>(ErrorCode::LocalWriteError, "cannot create " + partial.string());
    }

    const auto state = layout.blocks.size() > 1 ? TransferState::Chunked : TransferState::SingleShot;
    if (auto step = session.transition_to(state); step.is_error()) {
        return fail(step.error(), partial);
    }
    bus_.emit(events::TransferStartedEvent{display_name, TransferDirection::Download,
                                           layout.total_bytes, layout.block_size, 0, false});

    RetryPolicy retry(options.retry, sleeper_);
    std::uint64_t current_index = 0;
    retry.set_observer([&](std::size_t attempt, std::chrono::milliseconds wait, const Error& error) {
        bus_.emit(events::BlockRetryEvent{display_name, current_index, attempt, wait, error.message});
    });

    std::uint64_t written = 0;
    for (const auto& block : layout.blocks) {
        current_index = block.info.index;
        // Attachments are immutable, so a fetch is safe to repeat.
        auto data = retry.run("download of block " + block.attachment.name,
                              [&] { return remote_.fetch_attachment(block.attachment); },
                              ErrorCode::RemoteReadError);
        if (data.is_error()) {
            return fail(data.error(), partial);
        }
        if (data.value().size() != block.info.payload_size) {
            return fail(make_error(ErrorCode::ProtocolError,
                                   "block " + block.attachment.name + " arrived with " +
                                       std::to_string(data.value().size()) + " bytes, expected " +
                                       std::to_string(block.info.payload_size)),
                        partial);
        }

        output.write(reinterpret_cast<const char*>(data.value().data()),
                     static_cast<std::streamsize>(data.value().size()));
        if (!output) {
            return fail(make_error(ErrorCode::LocalWriteError, "cannot write " + partial.string()),
                        partial);
        }

        written += data.value().size();
        session.record_block(data.value().size());
        bus_.emit(events::BlockTransferredEvent{display_name, TransferDirection::Download,
                                                block.info.index, data.value().size(), written,
                                                layout.total_bytes});
    }

    output.close();
    if (!output) {
        return fail(make_error(ErrorCode::LocalWriteError, "cannot finish " + partial.string()), partial);
    }

    fs::rename(partial, destination, ec);
    if (ec) {
        return fail(make_error(ErrorCode::LocalWriteError,
                               "cannot move " + partial.string() + " to " + destination.string() +
                                   ": " + ec.message()),
                    partial);
    }

    if (auto step = session.transition_to(TransferState::Complete); step.is_error()) {
        return Err<TransferSummary>(step.error());
    }
    bus_.emit(events::TransferCompletedEvent{display_name, TransferDirection::Download,
                                             layout.total_bytes, layout.blocks.size(), session.elapsed()});

    spdlog::debug("downloaded {} into {}", display_name, destination.string());

    TransferSummary summary;
    summary.container_id = container.id;
    summary.total_bytes = layout.total_bytes;
    summary.blocks_transferred = layout.blocks.size();
    summary.block_size = layout.block_size;
    return Ok(summary);
}

} // namespace chanfs::transfer
