#include "chanfs/transport/memory_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chanfs::transport {
namespace {

constexpr const char* kUrlScheme = "memory://";

std::uint64_t parse_id(const std::string& id) {
    if (id.empty()) {
        return 0;
    }
    try {
        return std::stoull(id);
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

MemoryTransport::MemoryTransport(std::size_t max_attachment_size)
    : max_attachment_size_(max_attachment_size) {
}

Result<Container> MemoryTransport::create_container(const std::string& name,
                                                    const std::string& parent_group) {
    std::lock_guard lock(mutex_);
    if (name.empty()) {
        return Err<Container>(ErrorCode::InvalidArgument, "container name must not be empty");
    }

    StoredContainer stored;
    stored.container.id = std::to_string(next_id_++);
    stored.container.name = name;
    stored.parent_group = parent_group;
    const Container created = stored.container;
    containers_.emplace(created.id, std::move(stored));
    ++write_count_;

    spdlog::debug("memory: created container {} ({})", created.id, name);
    return Ok(created);
}

Result<void> MemoryTransport::set_container_topic(const std::string& container_id,
                                                  const std::string& topic) {
    std::lock_guard lock(mutex_);
    if (fail_topic_updates_) {
        return Err<void>(ErrorCode::RemoteWriteError, "injected topic update failure");
    }
    auto it = containers_.find(container_id);
    if (it == containers_.end()) {
        return Err<void>(ErrorCode::NotFound, "unknown container " + container_id);
    }
    it->second.container.topic = topic;
    ++write_count_;
    return Ok();
}

Result<void> MemoryTransport::delete_container(const std::string& container_id) {
    std::lock_guard lock(mutex_);
    if (containers_.erase(container_id) == 0) {
        return Err<void>(ErrorCode::NotFound, "unknown container " + container_id);
    }
    ++write_count_;
    return Ok();
}

Result<std::vector<Container>> MemoryTransport::list_containers(const std::string& parent_group) {
    std::lock_guard lock(mutex_);
    if (fail_listing_) {
        return Err<std::vector<Container>>(ErrorCode::RemoteReadError, "injected listing failure");
    }
    std::vector<Container> result;
    for (const auto& [id, stored] : containers_) {
        if (stored.parent_group == parent_group) {
            result.push_back(stored.container);
        }
    }
    return Ok(std::move(result));
}

Result<std::vector<Message>> MemoryTransport::list_messages(const std::string& container_id,
                                                            const MessageQuery& query) {
    std::lock_guard lock(mutex_);
    if (fail_listing_) {
        return Err<std::vector<Message>>(ErrorCode::RemoteReadError, "injected listing failure");
    }
    auto it = containers_.find(container_id);
    if (it == containers_.end()) {
        return Err<std::vector<Message>>(ErrorCode::NotFound, "unknown container " + container_id);
    }

    const std::uint64_t after = parse_id(query.after_id);
    const std::uint64_t before = parse_id(query.before_id);

    std::vector<const StoredMessage*> window;
    for (const auto& stored : it->second.messages) {
        if (stored.id <= after) {
            continue;
        }
        if (before != 0 && stored.id >= before) {
            continue;
        }
        window.push_back(&stored);
    }

    if (!query.ascending) {
        std::reverse(window.begin(), window.end());
    }
    if (window.size() > query.limit) {
        window.resize(query.limit);
    }

    std::vector<Message> result;
    result.reserve(window.size());
    for (const auto* stored : window) {
        result.push_back(to_message(container_id, *stored));
    }
    return Ok(std::move(result));
}

Result<Message> MemoryTransport::send_message(const std::string& container_id,
                                              const std::string& attachment_name,
                                              const std::vector<std::uint8_t>& data) {
    std::lock_guard lock(mutex_);
    ++send_attempts_;
    if (pending_send_failures_ > 0) {
        --pending_send_failures_;
        return Err<Message>(ErrorCode::RemoteWriteError, "injected send failure");
    }
    auto it = containers_.find(container_id);
    if (it == containers_.end()) {
        return Err<Message>(ErrorCode::NotFound, "unknown container " + container_id);
    }
    if (data.size() > max_attachment_size_) {
        return Err<Message>(ErrorCode::RemoteWriteError,
                            "attachment of " + std::to_string(data.size()) +
                                " bytes exceeds limit of " + std::to_string(max_attachment_size_));
    }

    StoredMessage stored;
    stored.id = next_id_++;
    stored.has_attachment = true;
    stored.attachment_name = attachment_name;
    stored.data = data;
    it->second.messages.push_back(stored);
    ++write_count_;
    return Ok(to_message(container_id, stored));
}

Result<void> MemoryTransport::pin_message(const std::string& container_id,
                                          const std::string& message_id) {
    std::lock_guard lock(mutex_);
    if (fail_pins_) {
        return Err<void>(ErrorCode::RemoteWriteError, "injected pin failure");
    }
    auto it = containers_.find(container_id);
    if (it == containers_.end()) {
        return Err<void>(ErrorCode::NotFound, "unknown container " + container_id);
    }
    const std::uint64_t id = parse_id(message_id);
    for (auto& stored : it->second.messages) {
        if (stored.id == id) {
            stored.pinned = true;
            ++write_count_;
            return Ok();
        }
    }
    return Err<void>(ErrorCode::NotFound, "unknown message " + message_id);
}

Result<std::vector<std::uint8_t>> MemoryTransport::fetch_attachment(const Attachment& attachment) {
    std::lock_guard lock(mutex_);
    const std::string scheme(kUrlScheme);
    if (attachment.url.compare(0, scheme.size(), scheme) != 0) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument,
                                              "not a memory attachment: " + attachment.url);
    }
    const auto path = attachment.url.substr(scheme.size());
    const auto slash = path.find('/');
    if (slash == std::string::npos) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument,
                                              "malformed attachment url: " + attachment.url);
    }

    auto it = containers_.find(path.substr(0, slash));
    if (it == containers_.end()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::RemoteReadError,
                                              "attachment container is gone: " + attachment.url);
    }
    const std::uint64_t id = parse_id(path.substr(slash + 1));
    for (const auto& stored : it->second.messages) {
        if (stored.id == id && stored.has_attachment) {
            return Ok(stored.data);
        }
    }
    return Err<std::vector<std::uint8_t>>(ErrorCode::RemoteReadError,
                                          "attachment not found: " + attachment.url);
}

Result<std::size_t> MemoryTransport::max_attachment_size() {
    std::lock_guard lock(mutex_);
    return Ok(max_attachment_size_);
}

void MemoryTransport::fail_next_sends(std::size_t count) {
    std::lock_guard lock(mutex_);
    pending_send_failures_ = count;
}

void MemoryTransport::set_fail_listing(bool enable) {
    std::lock_guard lock(mutex_);
    fail_listing_ = enable;
}

void MemoryTransport::set_fail_topic_updates(bool enable) {
    std::lock_guard lock(mutex_);
    fail_topic_updates_ = enable;
}

void MemoryTransport::set_fail_pins(bool enable) {
    std::lock_guard lock(mutex_);
    fail_pins_ = enable;
}

void MemoryTransport::set_max_attachment_size(std::size_t size) {
    std::lock_guard lock(mutex_);
    max_attachment_size_ = size;
}

std::vector<MemoryTransport::StoredMessage> MemoryTransport::messages(const std::string& container_id) const {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(container_id);
    if (it == containers_.end()) {
        return {};
    }
    return it->second.messages;
}

void MemoryTransport::post_text_message(const std::string& container_id) {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(container_id);
    if (it == containers_.end()) {
        return;
    }
    StoredMessage stored;
    stored.id = next_id_++;
    it->second.messages.push_back(stored);
}

void MemoryTransport::remove_message(const std::string& container_id, std::size_t position) {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(container_id);
    if (it == containers_.end() || position >= it->second.messages.size()) {
        return;
    }
    auto& list = it->second.messages;
    list.erase(list.begin() + static_cast<std::ptrdiff_t>(position));
}

std::size_t MemoryTransport::send_attempts() const {
    std::lock_guard lock(mutex_);
    return send_attempts_;
}

std::size_t MemoryTransport::write_count() const {
    std::lock_guard lock(mutex_);
    return write_count_;
}

std::size_t MemoryTransport::container_count() const {
    std::lock_guard lock(mutex_);
    return containers_.size();
}

Message MemoryTransport::to_message(const std::string& container_id, const StoredMessage& stored) {
    Message message;
    message.id = std::to_string(stored.id);
    if (stored.has_attachment) {
        Attachment attachment;
        attachment.name = stored.attachment_name;
        attachment.size = stored.data.size();
        attachment.url = kUrlScheme + container_id + "/" + message.id;
        message.attachment = attachment;
    }
    return message;
}

} // namespace chanfs::transport
