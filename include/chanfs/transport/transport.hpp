#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/transport/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chanfs::transport {

/**
 * @brief Port to the chat platform consumed by the transfer engine
 *
 * Implementations must return messages of a container in send order: an
 * ascending query starting after "0" yields the oldest message first, a
 * descending query without bounds yields the newest first.
 *
 * set_container_topic() and pin_message() are best-effort from the engine's
 * point of view, but implementations still report their failures.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<Container> create_container(const std::string& name,
                                               const std::string& parent_group) = 0;

    virtual Result<void> set_container_topic(const std::string& container_id,
                                             const std::string& topic) = 0;

    virtual Result<void> delete_container(const std::string& container_id) = 0;

    virtual Result<std::vector<Container>> list_containers(const std::string& parent_group) = 0;

    virtual Result<std::vector<Message>> list_messages(const std::string& container_id,
                                                       const MessageQuery& query) = 0;

    virtual Result<Message> send_message(const std::string& container_id,
                                         const std::string& attachment_name,
                                         const std::vector<std::uint8_t>& data) = 0;

    virtual Result<void> pin_message(const std::string& container_id,
                                     const std::string& message_id) = 0;

    virtual Result<std::vector<std::uint8_t>> fetch_attachment(const Attachment& attachment) = 0;

    virtual Result<std::size_t> max_attachment_size() = 0;
};

} // namespace chanfs::transport
