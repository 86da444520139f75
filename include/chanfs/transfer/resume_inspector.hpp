#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transfer/types.hpp"
#include "chanfs/transport/transport.hpp"

#include <cstdint>

namespace chanfs::transfer {

/**
 * @brief Reconstructs the state of an interrupted upload from the remote
 *
 * No transfer state is kept locally. The container's topic and its first
 * and last messages are the whole ledger:
 *  - the topic must equal the local size,
 *  - block 1's attachment size is the block size the upload used,
 *  - the newest block must be a full block, its name is the resume index.
 *
 * Every read fails fast; nothing here is retried.
 */
class ResumeInspector {
public:
    explicit ResumeInspector(transport::Transport& remote) : remote_(remote) {}

    Result<ResumePoint> inspect(const transport::Container& container,
                                std::uint64_t local_size) const;

private:
    transport::Transport& remote_;
};

} // namespace chanfs::transfer
