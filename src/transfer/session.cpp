#include "chanfs/transfer/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace chanfs::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Init, {TransferState::SingleShot, TransferState::Chunked}},
        {TransferState::SingleShot, {TransferState::Complete}},
        {TransferState::Chunked, {TransferState::Complete}},
    };

    if (target == TransferState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

TransferSession::TransferSession(std::string file_name,
                                 TransferDirection direction,
                                 std::uint64_t total_bytes) {
    info_.file_name = std::move(file_name);
    info_.direction = direction;
    info_.total_bytes = total_bytes;
    info_.started_at = std::chrono::steady_clock::now();
}

Result<void> TransferSession::transition_to(TransferState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("illegal transfer state transition ") + to_string(info_.state) +
                             " -> " + to_string(next_state));
    }

    info_.state = next_state;
    if (next_state != TransferState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(TransferState::Failed);
}

void TransferSession::skip_ahead(std::uint64_t blocks, std::uint64_t bytes) {
    info_.blocks_done = blocks;
    info_.bytes_done = bytes;
}

void TransferSession::record_block(std::uint64_t bytes) {
    ++info_.blocks_done;
    info_.bytes_done += bytes;
}

std::chrono::milliseconds TransferSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info_.started_at);
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == TransferState::Failed || info_.state == TransferState::Complete) {
        return false;
    }

    return is_progressive(info_.state, target);
}

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Init: return "Init";
        case TransferState::SingleShot: return "SingleShot";
        case TransferState::Chunked: return "Chunked";
        case TransferState::Complete: return "Complete";
        case TransferState::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace chanfs::transfer
