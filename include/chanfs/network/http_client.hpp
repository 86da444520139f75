#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/network/http_parser.hpp"
#include "chanfs/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace chanfs {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio
 *
 * One connection per request ("Connection: close"), which keeps the client
 * stateless between blocks: a failed request never poisons the next one.
 * Host names are resolved on every request.
 *
 * Usage:
 * ```cpp
 * HttpClient client("127.0.0.1", 8080);
 * HttpRequest request;
 * request.target = "/api/v10/guilds/1";
 * auto response = client.send(request);
 * ```
 */
class HttpClient {
public:
    HttpClient(std::string host, uint16_t port);

    /**
     * @brief Send a request and wait for the full response
     *
     * Transport-level failures (resolve, connect, I/O, malformed response)
     * are errors; any HTTP status is a successful exchange and left to the
     * caller to interpret.
     */
    Result<HttpResponse> send(HttpRequest request);

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    asio::io_context io_context_;
    std::array<char, 64 * 1024> buffer_;
};

} // namespace network
} // namespace chanfs
