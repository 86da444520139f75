#include "chanfs/naming/filename_codec.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>

namespace chanfs::naming {
namespace {

constexpr const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuv";

int symbol_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'v') {
        return c - 'a' + 10;
    }
    return -1;
}

// Unpadded base32 lengths mod 8 that correspond to whole bytes
bool valid_tail_length(std::size_t length) {
    switch (length % 8) {
        case 0:
        case 2:
        case 4:
        case 5:
        case 7:
            return true;
        default:
            return false;
    }
}

} // namespace

Result<std::string> FilenameCodec::encode(const std::string& filename) {
    if (filename.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "filename must not be empty");
    }

    std::string out;
    out.reserve((filename.size() * 8 + 4) / 5);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char byte : filename) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out += kAlphabet[(buffer >> (bits - 5)) & 0x1f];
            bits -= 5;
        }
    }
    if (bits > 0) {
        out += kAlphabet[(buffer << (5 - bits)) & 0x1f];
    }

    if (out.size() > kMaxContainerName) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "filename '" + filename + "' is too long to store remotely");
    }
    return Ok(std::move(out));
}

Result<std::string> FilenameCodec::decode(const std::string& container_name) {
    if (container_name.empty() || !valid_tail_length(container_name.size())) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "'" + container_name + "' is not an encoded filename");
    }

    std::string out;
    out.reserve(container_name.size() * 5 / 8);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : container_name) {
        const int value = symbol_value(c);
        if (value < 0) {
            return Err<std::string>(ErrorCode::InvalidArgument,
                                    "'" + container_name + "' is not an encoded filename");
        }
        buffer = (buffer << 5) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out += static_cast<char>((buffer >> (bits - 8)) & 0xff);
            bits -= 8;
        }
    }

    // Leftover padding bits must be zero for the canonical encoding.
    if ((buffer & ((1u << bits) - 1)) != 0) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "'" + container_name + "' is not an encoded filename");
    }
    return Ok(std::move(out));
}

FileMap build_file_map(const std::vector<transport::Container>& containers) {
    FileMap map;
    for (const auto& container : containers) {
        auto name = FilenameCodec::decode(container.name);
        if (name.is_error()) {
            spdlog::debug("skipping foreign channel {}", container.name);
            continue;
        }
        map.emplace(name.value(), container);
    }
    return map;
}

} // namespace chanfs::naming
