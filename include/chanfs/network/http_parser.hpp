#pragma once

#include "chanfs/core/result.hpp"
#include "chanfs/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace chanfs {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF  <- Status line
 * Header-Name: Header-Value CRLF    <- Headers (multiple)
 * CRLF                              <- Empty line
 * [Body]                            <- Content-Length bytes, chunked, or until close
 */
enum class ParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,             // Content-Length delimited
    CHUNK_SIZE,       // Transfer-Encoding: chunked
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE, // Neither length nor chunked: body ends with the connection
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Data can be fed in arbitrary pieces as it arrives from the socket:
 * ```cpp
 * HttpResponseParser parser;
 * while (!done) {
 *     auto n = socket.read_some(asio::buffer(buf), ec);
 *     if (ec == asio::error::eof) { parser.finish(); break; }
 *     auto result = parser.parse(buf.data(), n);
 *     done = result.is_ok() && result.value();
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @return true once the response is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            switch (state_) {
                case ParseState::BODY:
                case ParseState::CHUNK_DATA:
                case ParseState::BODY_UNTIL_CLOSE:
                    i += consume_body(data + i, len - i);
                    break;
                case ParseState::COMPLETE:
                    return Ok(true);
                case ParseState::PARSE_ERROR:
                    return fail("parser in error state");
                default:
                    if (!parse_char(data[i])) {
                        state_ = ParseState::PARSE_ERROR;
                        return fail("malformed HTTP response at line " + std::to_string(line_));
                    }
                    ++i;
                    break;
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a body that is delimited by connection close; anything else
     * still pending is a truncated response.
     */
    Result<bool> finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE || state_ == ParseState::COMPLETE) {
            state_ = ParseState::COMPLETE;
            return Ok(true);
        }
        return fail("connection closed before the response was complete");
    }

    const HttpResponse& get_response() const { return response_; }
    HttpResponse take_response() { return std::move(response_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    /// Responses to HEAD-like requests and 1xx/204/304 carry no body
    void set_expect_no_body(bool value) { expect_no_body_ = value; }

    void reset() {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    static constexpr size_t kMaxReserve = 1024 * 1024;

    ParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    size_t remaining_;            // Bytes left in the body or current chunk
    size_t line_;
    bool last_char_was_cr_;
    bool expect_no_body_ = false;

    static Result<bool> fail(const std::string& message) {
        return Err<bool>(ErrorCode::ProtocolError, message);
    }

    // Returns true on CRLF (or bare LF), leaving the line in buffer_.
    bool end_of_line(char c, bool& error) {
        error = false;
        if (c == '\r') {
            last_char_was_cr_ = true;
            return false;
        }
        if (c == '\n') {
            last_char_was_cr_ = false;
            ++line_;
            return true;
        }
        if (last_char_was_cr_) {
            error = true;
        }
        return false;
    }

    bool parse_char(char c) {
        bool error = false;
        switch (state_) {
            case ParseState::VERSION:
                if (c == ' ') {
                    if (buffer_ == "HTTP/1.1") {
                        response_.version = HttpVersion::HTTP_1_1;
                    } else if (buffer_ == "HTTP/1.0") {
                        response_.version = HttpVersion::HTTP_1_0;
                    } else {
                        return false;
                    }
                    buffer_.clear();
                    state_ = ParseState::STATUS_CODE;
                    return true;
                }
                if (buffer_.size() > 8 || !std::isprint(static_cast<unsigned char>(c))) {
                    return false;
                }
                buffer_ += c;
                return true;

            case ParseState::STATUS_CODE:
                if (c == ' ' || c == '\r' || c == '\n') {
                    if (buffer_.size() != 3) {
                        return false;
                    }
                    response_.status_code = std::atoi(buffer_.c_str());
                    buffer_.clear();
                    state_ = ParseState::REASON;
                    if (c != ' ') {
                        return parse_char(c);
                    }
                    return true;
                }
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return false;
                }
                buffer_ += c;
                return true;

            case ParseState::REASON:
                if (end_of_line(c, error)) {
                    response_.reason_phrase = buffer_;
                    buffer_.clear();
                    state_ = ParseState::HEADER_NAME;
                    return true;
                }
                if (!error && c != '\r') {
                    buffer_ += c;
                }
                return !error;

            case ParseState::HEADER_NAME:
                if (end_of_line(c, error)) {
                    if (!buffer_.empty()) {
                        return false;
                    }
                    return start_body();
                }
                if (error) {
                    return false;
                }
                if (c == '\r') {
                    return true;
                }
                if (c == ':') {
                    if (buffer_.empty()) {
                        return false;
                    }
                    current_header_name_ = buffer_;
                    buffer_.clear();
                    state_ = ParseState::HEADER_VALUE;
                    return true;
                }
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
                    return false;
                }
                buffer_ += c;
                return true;

            case ParseState::HEADER_VALUE:
                if (buffer_.empty() && (c == ' ' || c == '\t')) {
                    return true;
                }
                if (end_of_line(c, error)) {
                    response_.headers[current_header_name_] = buffer_;
                    buffer_.clear();
                    current_header_name_.clear();
                    state_ = ParseState::HEADER_NAME;
                    return true;
                }
                if (!error && c != '\r') {
                    buffer_ += c;
                }
                return !error;

            case ParseState::CHUNK_SIZE:
                if (end_of_line(c, error)) {
                    // Chunk extensions after ';' are ignored
                    const auto hex = buffer_.substr(0, buffer_.find(';'));
                    buffer_.clear();
                    if (hex.empty()) {
                        return false;
                    }
                    if (!parse_length(hex, 16, remaining_)) {
                        return false;
                    }
                    state_ = remaining_ == 0 ? ParseState::CHUNK_TRAILER : ParseState::CHUNK_DATA;
                    return true;
                }
                if (!error && c != '\r') {
                    buffer_ += c;
                }
                return !error;

            case ParseState::CHUNK_DATA_END:
                if (end_of_line(c, error)) {
                    state_ = ParseState::CHUNK_SIZE;
                    return true;
                }
                return !error && c == '\r';

            case ParseState::CHUNK_TRAILER:
                if (end_of_line(c, error)) {
                    if (buffer_.empty()) {
                        state_ = ParseState::COMPLETE;
                    }
                    buffer_.clear();
                    return true;
                }
                if (!error && c != '\r') {
                    buffer_ += c;
                }
                return !error;

            default:
                return false;
        }
    }

    // Digits only, no sign or whitespace, and the value must fit size_t.
    static bool parse_length(const std::string& text, int base, size_t& out) {
        if (text.empty()) {
            return false;
        }
        for (char ch : text) {
            const auto uch = static_cast<unsigned char>(ch);
            if (base == 16 ? !std::isxdigit(uch) : !std::isdigit(uch)) {
                return false;
            }
        }
        errno = 0;
        char* end = nullptr;
        const unsigned long long value = std::strtoull(text.c_str(), &end, base);
        if (errno == ERANGE || end == nullptr || *end != '\0' ||
            value > static_cast<unsigned long long>(SIZE_MAX)) {
            return false;
        }
        out = static_cast<size_t>(value);
        return true;
    }

    bool start_body() {
        const int status = response_.status_code;
        if (expect_no_body_ || status == 204 || status == 304 || (status >= 100 && status < 200)) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::string encoding = response_.get_header("Transfer-Encoding");
        std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        if (response_.has_header("Content-Length")) {
            if (!parse_length(response_.get_header("Content-Length"), 10, remaining_)) {
                return false;
            }
            if (remaining_ == 0) {
                state_ = ParseState::COMPLETE;
                return true;
            }
            // The header is only a hint, the body grows as bytes arrive
            response_.body.reserve(std::min(remaining_, kMaxReserve));
            state_ = ParseState::BODY;
            return true;
        }

        state_ = ParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    size_t consume_body(const char* data, size_t len) {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            response_.body.insert(response_.body.end(), data, data + len);
            return len;
        }

        const size_t take = std::min(len, remaining_);
        response_.body.insert(response_.body.end(), data, data + take);
        remaining_ -= take;
        if (remaining_ == 0) {
            state_ = state_ == ParseState::BODY ? ParseState::COMPLETE : ParseState::CHUNK_DATA_END;
        }
        return take;
    }
};

} // namespace network
} // namespace chanfs
