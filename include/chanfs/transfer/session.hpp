#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chanfs::transfer {

/**
 * @brief Point-in-time view of one file transfer
 */
struct TransferInfo {
    std::string file_name;
    TransferDirection direction = TransferDirection::Upload;
    TransferState state = TransferState::Init;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t blocks_done = 0;
    std::chrono::steady_clock::time_point started_at{};
    std::string last_error; ///< Populated when state == Failed
};

/**
 * @brief Per-file state machine: Init -> (SingleShot | Chunked) -> Complete
 *
 * Failed is reachable from every non-terminal state. Complete and Failed are
 * terminal.
 */
class TransferSession {
public:
    TransferSession(std::string file_name, TransferDirection direction, std::uint64_t total_bytes);

    [[nodiscard]] const std::string& file_name() const noexcept { return info_.file_name; }
    [[nodiscard]] TransferState state() const noexcept { return info_.state; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }

    Result<void> transition_to(TransferState next_state);
    Result<void> mark_failed(std::string error_message);

    /// Starting point of a resumed transfer
    void skip_ahead(std::uint64_t blocks, std::uint64_t bytes);
    void record_block(std::uint64_t bytes);

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferInfo info_;
};

const char* to_string(TransferState state);

} // namespace chanfs::transfer
