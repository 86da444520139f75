#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transport/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chanfs::transfer {

/**
 * @brief Attachment ready to be posted as one block
 */
struct NamedAttachment {
    std::string name;
    std::vector<std::uint8_t> payload;
};

/**
 * @brief Identity of a block as read back from the remote
 */
struct BlockInfo {
    std::uint64_t index = 0;
    std::size_t payload_size = 0;
};

/**
 * @brief Pure mapping between blocks and attachments
 *
 * A block's attachment is named with its 1-based index in decimal. A file
 * that fits into one attachment is block "1", the same as the first block of
 * a chunked file, so resume logic never needs to tell them apart.
 *
 * The container topic holds the logical file size in decimal.
 */
class BlockCodec {
public:
    static constexpr const char* kFirstBlockName = "1";

    static NamedAttachment encode(std::uint64_t index, std::vector<std::uint8_t> payload);

    static std::string block_name(std::uint64_t index);

    /// Fails with MalformedBlockName when the name is not an unsigned decimal
    static Result<BlockInfo> decode(const transport::Attachment& attachment);

    static Result<std::uint64_t> parse_index(const std::string& name);

    static std::string encode_topic(std::uint64_t size);

    /// Fails with SizeMismatch when the topic is not an unsigned decimal
    static Result<std::uint64_t> decode_topic(const std::string& topic);
};

} // namespace chanfs::transfer
