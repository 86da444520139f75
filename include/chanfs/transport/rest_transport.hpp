#pragma once

#include "chanfs/network/http_client.hpp"
#include "chanfs/transport/transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chanfs::transport {

struct RestOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 80;
    std::string api_base = "/api/v10";
    std::string token;
    std::string guild_id;
    std::optional<std::size_t> max_attachment_size;  ///< Overrides the tier lookup
};

/**
 * @brief Transport speaking the chat platform's REST API
 *
 * Containers are guild text channels, blocks are messages carrying one file.
 * Requests go to the configured gateway over plain HTTP/1.1; attachment
 * downloads are sent to the same gateway in absolute-form, which forwards
 * them to the CDN.
 */
class RestTransport : public Transport {
public:
    explicit RestTransport(RestOptions options);

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

private:
    network::HttpRequest make_request(network::HttpMethod method, const std::string& path) const;

    Result<network::HttpResponse> exchange(network::HttpRequest request, ErrorCode failure_code);

    Result<nlohmann::json> exchange_json(network::HttpRequest request, ErrorCode failure_code);

    RestOptions options_;
    network::HttpClient client_;
    std::optional<std::size_t> cached_limit_;
};

namespace rest {

inline constexpr int kTextChannelType = 0;
inline constexpr std::size_t kMaxPageSize = 100;

/// Upload ceiling for a guild premium tier
std::size_t limit_for_premium_tier(int tier);

/// Numeric order of snowflake ids given as decimal strings
bool snowflake_less(const std::string& lhs, const std::string& rhs);

/// Guild text channel; other channel kinds and malformed entries are skipped
bool is_text_channel(const nlohmann::json& channel);

Result<Container> container_from_json(const nlohmann::json& channel);

Result<Message> message_from_json(const nlohmann::json& message);

/**
 * @brief Body of a message-with-one-file request
 *
 * Two parts: "payload_json" declaring attachment 0, and "files[0]" with the
 * raw bytes.
 */
std::vector<std::uint8_t> build_multipart(const std::string& boundary,
                                          const std::string& filename,
                                          const std::vector<std::uint8_t>& data);

/// Human-readable reason from an error response body, or the status line
std::string describe_failure(const network::HttpResponse& response);

} // namespace rest

} // namespace chanfs::transport
