#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chanfs::transport {

/**
 * @brief File attached to a message
 *
 * `url` is only meaningful to the transport that produced it; the engine
 * hands the whole attachment back to Transport::fetch_attachment().
 */
struct Attachment {
    std::string name;
    std::size_t size = 0;
    std::string url;
};

struct Message {
    std::string id;
    std::optional<Attachment> attachment;
};

/**
 * @brief Remote container (a text channel) standing in for one file
 */
struct Container {
    std::string id;
    std::string name;   ///< Encoded logical filename
    std::string topic;  ///< Decimal total size of the logical file
};

/**
 * @brief Paging window for Transport::list_messages()
 *
 * Mirrors the chat API: at most `limit` messages, optionally strictly before
 * or strictly after a message id. `ascending` selects oldest-first ordering
 * of the returned page.
 */
struct MessageQuery {
    std::size_t limit = 50;
    std::string before_id;
    std::string after_id;
    bool ascending = false;
};

} // namespace chanfs::transport
