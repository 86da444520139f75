#pragma once

#include "chanfs/transport/transport.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chanfs::transport {

/**
 * @brief In-process Transport backed by a map of containers
 *
 * Message ids are drawn from one monotonically increasing counter, so id
 * order equals send order across the whole store, like snowflake ids on the
 * real platform. All operations are serialized by an internal mutex.
 *
 * Fault injection hooks let tests simulate an unreliable remote:
 * @code
 * MemoryTransport remote(1024);
 * remote.fail_next_sends(3);   // next three send_message() calls fail
 * remote.set_fail_pins(true);  // pin_message() always fails
 * @endcode
 */
class MemoryTransport : public Transport {
public:
    explicit MemoryTransport(std::size_t max_attachment_size);

    Result<Container> create_container(const std::string& name,
                                       const std::string& parent_group) override;
    Result<void> set_container_topic(const std::string& container_id,
                                     const std::string& topic) override;
    Result<void> delete_container(const std::string& container_id) override;
    Result<std::vector<Container>> list_containers(const std::string& parent_group) override;
    Result<std::vector<Message>> list_messages(const std::string& container_id,
                                               const MessageQuery& query) override;
    Result<Message> send_message(const std::string& container_id,
                                 const std::string& attachment_name,
                                 const std::vector<std::uint8_t>& data) override;
    Result<void> pin_message(const std::string& container_id,
                             const std::string& message_id) override;
    Result<std::vector<std::uint8_t>> fetch_attachment(const Attachment& attachment) override;
    Result<std::size_t> max_attachment_size() override;

    // ────────────────────────────────────────────────────────────
    // Fault injection
    // ────────────────────────────────────────────────────────────

    void fail_next_sends(std::size_t count);
    void set_fail_listing(bool enable);
    void set_fail_topic_updates(bool enable);
    void set_fail_pins(bool enable);
    void set_max_attachment_size(std::size_t size);

    // ────────────────────────────────────────────────────────────
    // Inspection and tampering
    // ────────────────────────────────────────────────────────────

    struct StoredMessage {
        std::uint64_t id = 0;
        bool has_attachment = false;
        std::string attachment_name;
        std::vector<std::uint8_t> data;
        bool pinned = false;
    };

    std::vector<StoredMessage> messages(const std::string& container_id) const;

    /// Appends a message without attachment (e.g. a pin notice)
    void post_text_message(const std::string& container_id);

    /// Removes the message at `position` (0-based, send order)
    void remove_message(const std::string& container_id, std::size_t position);

    std::size_t send_attempts() const;
    std::size_t write_count() const;
    std::size_t container_count() const;

private:
    struct StoredContainer {
        Container container;
        std::string parent_group;
        std::vector<StoredMessage> messages;
    };

    static Message to_message(const std::string& container_id, const StoredMessage& stored);

    mutable std::mutex mutex_;
    std::map<std::string, StoredContainer> containers_;
    std::uint64_t next_id_ = 1;
    std::size_t max_attachment_size_;

    std::size_t pending_send_failures_ = 0;
    bool fail_listing_ = false;
    bool fail_topic_updates_ = false;
    bool fail_pins_ = false;

    std::size_t send_attempts_ = 0;
    std::size_t write_count_ = 0;
};

} // namespace chanfs::transport
