#pragma once

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace chanfs {
namespace network {

/**
 * @brief HTTP request methods used against the chat REST API
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_METHOD,  // Renamed to avoid Windows macro conflict
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

using HeaderMap = std::unordered_map<std::string, std::string>;

// Headers are case-insensitive per RFC 7230, stored as sent.
inline const std::string* lookup_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
#ifdef _WIN32
        if (_stricmp(key.c_str(), name.c_str()) == 0) {
#else
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
#endif
            return &value;
        }
    }
    return nullptr;
}

inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    const auto* value = lookup_header(headers, name);
    return value ? *value : "";
}

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "PATCH") return HttpMethod::PATCH;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::PATCH: return "PATCH";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * `target` is either origin-form ("/api/v10/channels/1") or absolute-form
 * ("https://cdn.example.com/a/b") when the request goes through a gateway
 * that forwards it.
 *
 * Wire format produced by serialize():
 * POST /api/v10/channels/1/messages HTTP/1.1\r\n
 * Host: gateway\r\n
 * Content-Length: 42\r\n
 * \r\n
 * [body]
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;
    HeaderMap headers;
    std::vector<std::uint8_t> body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    void set_body(const std::string& content, const std::string& content_type) {
        body.assign(content.begin(), content.end());
        headers["Content-Type"] = content_type;
    }

    void set_body(std::vector<std::uint8_t> data, const std::string& content_type) {
        body = std::move(data);
        headers["Content-Type"] = content_type;
    }

    std::vector<std::uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << target << " HTTP/1.1\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (headers.find("Content-Length") == headers.end()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<std::uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }
};

/**
 * @brief Parsed HTTP response
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return lookup_header(headers, name) != nullptr;
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

} // namespace network
} // namespace chanfs
