#include "chanfs/network/http_client.hpp"

#include <spdlog/spdlog.h>

namespace chanfs {
namespace network {

namespace {

Result<HttpResponse> io_error(const std::string& what, const boost::system::error_code& ec) {
    return Err<HttpResponse>(ErrorCode::ProtocolError, what + ": " + ec.message());
}

} // namespace

HttpClient::HttpClient(std::string host, uint16_t port)
    : host_(std::move(host))
    , port_(port) {
}

Result<HttpResponse> HttpClient::send(HttpRequest request) {
    boost::system::error_code ec;

    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        return io_error("cannot resolve " + host_, ec);
    }

    tcp::socket socket(io_context_);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return io_error("cannot connect to " + host_ + ":" + std::to_string(port_), ec);
    }

    request.set_header("Host", port_ == 80 ? host_ : host_ + ":" + std::to_string(port_));
    request.set_header("Connection", "close");
    if (request.get_header("User-Agent").empty()) {
        request.set_header("User-Agent", "chanfs/1.0");
    }

    const std::vector<uint8_t> wire = request.serialize();
    asio::write(socket, asio::buffer(wire), ec);
    if (ec) {
        return io_error("cannot send request", ec);
    }
    spdlog::debug("{} {} ({} bytes sent)",
                  HttpMethodUtils::to_string(request.method), request.target, wire.size());

    HttpResponseParser parser;
    for (;;) {
        const size_t received = socket.read_some(asio::buffer(buffer_), ec);
        if (ec == asio::error::eof) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }
        if (ec) {
            return io_error("cannot read response", ec);
        }

        auto parsed = parser.parse(buffer_.data(), received);
        if (parsed.is_error()) {
            return Err<HttpResponse>(parsed.error());
        }
        if (parsed.value()) {
            break;
        }
    }

    boost::system::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);

    HttpResponse response = parser.take_response();
    spdlog::debug("{} {} -> {} ({} bytes)",
                  HttpMethodUtils::to_string(request.method), request.target,
                  response.status_code, response.body.size());
    return Ok(std::move(response));
}

} // namespace network
} // namespace chanfs
