#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transport/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace chanfs::naming {

/**
 * @brief Maps logical filenames onto the container name charset
 *
 * Container names only allow lowercase letters, digits, '-' and '_', and at
 * most kMaxContainerName characters. Filenames are encoded as lowercase
 * base32hex (RFC 4648, alphabet 0-9a-v) without padding, which keeps case,
 * dots and any UTF-8 intact. Decoding is strict: only the canonical encoding
 * of some byte string decodes, anything else is a foreign channel.
 */
class FilenameCodec {
public:
    static constexpr std::size_t kMaxContainerName = 100;

    static Result<std::string> encode(const std::string& filename);
    static Result<std::string> decode(const std::string& container_name);
};

/// Logical filename -> container, ordered by name
using FileMap = std::map<std::string, transport::Container>;

/**
 * @brief Indexes containers by the logical filename their name encodes
 *
 * Containers whose names do not decode are skipped.
 */
FileMap build_file_map(const std::vector<transport::Container>& containers);

} // namespace chanfs::naming
