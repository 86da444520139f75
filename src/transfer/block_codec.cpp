#include "chanfs/transfer/block_codec.hpp"

#include <cctype>
#include <limits>

namespace chanfs::transfer {
namespace {

// Strict unsigned decimal: no sign, no whitespace, no overflow.
bool parse_decimal(const std::string& text, std::uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace

NamedAttachment BlockCodec::encode(std::uint64_t index, std::vector<std::uint8_t> payload) {
    NamedAttachment attachment;
    attachment.name = block_name(index);
    attachment.payload = std::move(payload);
    return attachment;
}

std::string BlockCodec::block_name(std::uint64_t index) {
    return std::to_string(index);
}

Result<BlockInfo> BlockCodec::decode(const transport::Attachment& attachment) {
    auto index = parse_index(attachment.name);
    if (index.is_error()) {
        return Err<BlockInfo>(index.error());
    }
    BlockInfo info;
    info.index = index.value();
    info.payload_size = attachment.size;
    return Ok(info);
}

Result<std::uint64_t> BlockCodec::parse_index(const std::string& name) {
    std::uint64_t index = 0;
    if (!parse_decimal(name, index) || index == 0) {
        return Err<std::uint64_t>(ErrorCode::MalformedBlockName,
                                  "malformed block name '" + name + "'");
    }
    return Ok(index);
}

std::string BlockCodec::encode_topic(std::uint64_t size) {
    return std::to_string(size);
}

Result<std::uint64_t> BlockCodec::decode_topic(const std::string& topic) {
    std::uint64_t size = 0;
    if (!parse_decimal(topic, size)) {
        return Err<std::uint64_t>(ErrorCode::SizeMismatch,
                                  "remote file size record '" + topic + "' is not a size");
    }
    return Ok(size);
}

} // namespace chanfs::transfer
