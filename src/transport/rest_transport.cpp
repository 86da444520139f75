#include "chanfs/transport/rest_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <sstream>

namespace chanfs::transport {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

std::string make_boundary() {
    static const char digits[] = "0123456789abcdef";
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<int> pick(0, 15);
    std::string boundary = "chanfs-";
    for (int i = 0; i < 24; ++i) {
        boundary += digits[pick(generator)];
    }
    return boundary;
}

std::string query_string(const MessageQuery& query) {
    std::ostringstream oss;
    oss << "?limit=" << std::min(query.limit, rest::kMaxPageSize);
    if (!query.before_id.empty()) {
        oss << "&before=" << query.before_id;
    }
    if (!query.after_id.empty()) {
        oss << "&after=" << query.after_id;
    } else if (query.ascending && query.before_id.empty()) {
        oss << "&after=0";
    }
    return oss.str();
}

} // namespace

namespace rest {

std::size_t limit_for_premium_tier(int tier) {
    switch (tier) {
        case 2: return 50 * kMiB;
        case 3: return 100 * kMiB;
        default: return 10 * kMiB;
    }
}

bool snowflake_less(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size();
    }
    return lhs < rhs;
}

bool is_text_channel(const json& channel) {
    return channel.is_object() && channel.contains("type") && channel["type"].is_number_integer() &&
           channel["type"].get<int>() == kTextChannelType;
}

Result<Container> container_from_json(const json& channel) {
    if (!channel.is_object() || !channel.contains("id") || !channel["id"].is_string()) {
        return Err<Container>(ErrorCode::ProtocolError, "channel object without id");
    }
    Container container;
    container.id = channel["id"].get<std::string>();
    if (channel.contains("name") && channel["name"].is_string()) {
        container.name = channel["name"].get<std::string>();
    }
    // Discord sends "topic": null for channels that never had one
    if (channel.contains("topic") && channel["topic"].is_string()) {
        container.topic = channel["topic"].get<std::string>();
    }
    return Ok(container);
}

Result<Message> message_from_json(const json& message) {
    if (!message.is_object() || !message.contains("id") || !message["id"].is_string()) {
        return Err<Message>(ErrorCode::ProtocolError, "message object without id");
    }
    Message result;
    result.id = message["id"].get<std::string>();

    const auto it = message.find("attachments");
    if (it != message.end() && it->is_array() && !it->empty()) {
        const auto& first = it->front();
        if (!first.is_object() || !first.contains("size") || !first["size"].is_number_unsigned()) {
            return Err<Message>(ErrorCode::ProtocolError,
                                "attachment of message " + result.id + " has no size");
        }
        Attachment attachment;
        attachment.size = first["size"].get<std::size_t>();
        if (first.contains("filename") && first["filename"].is_string()) {
            attachment.name = first["filename"].get<std::string>();
        }
        if (first.contains("url") && first["url"].is_string()) {
            attachment.url = first["url"].get<std::string>();
        }
        result.attachment = attachment;
    }
    return Ok(result);
}

std::vector<std::uint8_t> build_multipart(const std::string& boundary,
                                          const std::string& filename,
                                          const std::vector<std::uint8_t>& data) {
    const json payload = {
        {"attachments", json::array({json{{"id", 0}, {"filename", filename}}})}
    };

    std::ostringstream head;
    head << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"payload_json\"\r\n"
         << "Content-Type: application/json\r\n\r\n"
         << payload.dump() << "\r\n"
         << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"files[0]\"; filename=\"" << filename << "\"\r\n"
         << "Content-Type: application/octet-stream\r\n\r\n";
    const std::string tail = "\r\n--" + boundary + "--\r\n";

    const std::string head_str = head.str();
    std::vector<std::uint8_t> body;
    body.reserve(head_str.size() + data.size() + tail.size());
    body.insert(body.end(), head_str.begin(), head_str.end());
    body.insert(body.end(), data.begin(), data.end());
    body.insert(body.end(), tail.begin(), tail.end());
    return body;
}

std::string describe_failure(const HttpResponse& response) {
    std::string reason = "HTTP " + std::to_string(response.status_code);
    auto body = json::parse(response.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("message") && body["message"].is_string()) {
        return reason + ": " + body["message"].get<std::string>();
    }
    if (!response.reason_phrase.empty()) {
        return reason + " " + response.reason_phrase;
    }
    return reason;
}

} // namespace rest

RestTransport::RestTransport(RestOptions options)
    : options_(std::move(options))
    , client_(options_.host, options_.port)
    , cached_limit_(options_.max_attachment_size) {
}

HttpRequest RestTransport::make_request(HttpMethod method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.target = options_.api_base + path;
    request.set_header("Authorization", "Bot " + options_.token);
    return request;
}

Result<HttpResponse> RestTransport::exchange(HttpRequest request, ErrorCode failure_code) {
    const auto method = network::HttpMethodUtils::to_string(request.method);
    const auto target = request.target;

    auto response = client_.send(std::move(request));
    if (response.is_error()) {
        return Err<HttpResponse>(failure_code, response.error().message);
    }
    if (!response.value().is_success()) {
        const auto code = response.value().status_code == 404 ? ErrorCode::NotFound : failure_code;
        const auto reason = rest::describe_failure(response.value());
        spdlog::debug("{} {} failed: {}", method, target, reason);
        return Err<HttpResponse>(code, reason);
    }
    return response;
}

Result<json> RestTransport::exchange_json(HttpRequest request, ErrorCode failure_code) {
    auto response = exchange(std::move(request), failure_code);
    if (response.is_error()) {
        return Err<json>(response.error());
    }
    auto body = json::parse(response.value().body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err<json>(ErrorCode::ProtocolError, "response is not valid JSON");
    }
    return Ok(std::move(body));
}

Result<Container> RestTransport::create_container(const std::string& name,
                                                  const std::string& parent_group) {
    auto request = make_request(HttpMethod::POST, "/guilds/" + parent_group + "/channels");
    request.set_body(json{{"name", name}, {"type", rest::kTextChannelType}}.dump(), "application/json");

    auto body = exchange_json(std::move(request), ErrorCode::RemoteWriteError);
    if (body.is_error()) {
        return Err<Container>(body.error());
    }
    return rest::container_from_json(body.value());
}

Result<void> RestTransport::set_container_topic(const std::string& container_id,
                                                const std::string& topic) {
    auto request = make_request(HttpMethod::PATCH, "/channels/" + container_id);
    request.set_body(json{{"topic", topic}}.dump(), "application/json");

    auto response = exchange(std::move(request), ErrorCode::RemoteWriteError);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<void> RestTransport::delete_container(const std::string& container_id) {
    auto response = exchange(make_request(HttpMethod::DELETE_METHOD, "/channels/" + container_id),
                             ErrorCode::RemoteWriteError);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<std::vector<Container>> RestTransport::list_containers(const std::string& parent_group) {
    auto body = exchange_json(make_request(HttpMethod::GET, "/guilds/" + parent_group + "/channels"),
                              ErrorCode::RemoteReadError);
    if (body.is_error()) {
        return Err<std::vector<Container>>(body.error());
    }
    if (!body.value().is_array()) {
        return Err<std::vector<Container>>(ErrorCode::ProtocolError, "channel list is not an array");
    }

    std::vector<Container> containers;
    for (const auto& channel : body.value()) {
        if (!rest::is_text_channel(channel)) {
            continue;
        }
        auto container = rest::container_from_json(channel);
        if (container.is_error()) {
            return Err<std::vector<Container>>(container.error());
        }
        containers.push_back(std::move(container.value()));
    }
    return Ok(std::move(containers));
}

Result<std::vector<Message>> RestTransport::list_messages(const std::string& container_id,
                                                          const MessageQuery& query) {
    auto body = exchange_json(make_request(HttpMethod::GET,
                                           "/channels/" + container_id + "/messages" + query_string(query)),
                              ErrorCode::RemoteReadError);
    if (body.is_error()) {
        return Err<std::vector<Message>>(body.error());
    }
    if (!body.value().is_array()) {
        return Err<std::vector<Message>>(ErrorCode::ProtocolError, "message list is not an array");
    }

    std::vector<Message> messages;
    for (const auto& item : body.value()) {
        auto message = rest::message_from_json(item);
        if (message.is_error()) {
            return Err<std::vector<Message>>(message.error());
        }
        messages.push_back(std::move(message.value()));
    }

    // The API returns newest first in every paging mode.
    std::sort(messages.begin(), messages.end(), [&](const Message& a, const Message& b) {
        return query.ascending ? rest::snowflake_less(a.id, b.id) : rest::snowflake_less(b.id, a.id);
    });
    return Ok(std::move(messages));
}

Result<Message> RestTransport::send_message(const std::string& container_id,
                                            const std::string& attachment_name,
                                            const std::vector<std::uint8_t>& data) {
    const auto boundary = make_boundary();
    auto request = make_request(HttpMethod::POST, "/channels/" + container_id + "/messages");
    request.set_body(rest::build_multipart(boundary, attachment_name, data),
                     "multipart/form-data; boundary=" + boundary);

    auto body = exchange_json(std::move(request), ErrorCode::RemoteWriteError);
    if (body.is_error()) {
        return Err<Message>(body.error());
    }
    return rest::message_from_json(body.value());
}

Result<void> RestTransport::pin_message(const std::string& container_id,
                                        const std::string& message_id) {
    auto response = exchange(make_request(HttpMethod::PUT, "/channels/" + container_id + "/pins/" + message_id),
                             ErrorCode::RemoteWriteError);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> RestTransport::fetch_attachment(const Attachment& attachment) {
    if (attachment.url.rfind("http://", 0) != 0 && attachment.url.rfind("https://", 0) != 0) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::ProtocolError,
                                              "attachment " + attachment.name + " has no download url");
    }

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.target = attachment.url;

    auto response = exchange(std::move(request), ErrorCode::RemoteReadError);
    if (response.is_error()) {
        return Err<std::vector<std::uint8_t>>(response.error());
    }
    return Ok(std::move(response.value().body));
}

Result<std::size_t> RestTransport::max_attachment_size() {
    if (cached_limit_) {
        return Ok(*cached_limit_);
    }

    auto body = exchange_json(make_request(HttpMethod::GET, "/guilds/" + options_.guild_id),
                              ErrorCode::RemoteReadError);
    if (body.is_error()) {
        return Err<std::size_t>(body.error());
    }
    const auto& guild = body.value();
    const int tier = guild.is_object() && guild.contains("premium_tier") && guild["premium_tier"].is_number_integer()
        ? guild["premium_tier"].get<int>()
        : 0;
    cached_limit_ = rest::limit_for_premium_tier(tier);
    spdlog::debug("guild {} premium tier {}: attachment limit {} bytes", options_.guild_id, tier, *cached_limit_);
    return Ok(*cached_limit_);
}

} // namespace chanfs::transport
