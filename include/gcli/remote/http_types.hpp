#pragma once

#include <cstdint>
#include <string>
#include <strings.h>
#include <utility>
#include <vector>

namespace gcli::remote {

/**
 * @brief HTTP request methods used by the archive service API
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a macro on some platforms
    HEAD
};

/**
 * @brief Ordered header list with case-insensitive lookup
 *
 * HTTP header names are case-insensitive per RFC 7230. Headers are stored
 * as given so a request is serialised (and signed) exactly as built.
 */
class HttpHeaders {
public:
    using Entry = std::pair<std::string, std::string>;

    /// Replace any existing value for name.
    void set(const std::string& name, const std::string& value) {
        for (auto& [key, existing] : entries_) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                existing = value;
                return;
            }
        }
        entries_.emplace_back(name, value);
    }

    /// Value for name, empty string if absent
    std::string get(const std::string& name) const {
        for (const auto& [key, value] : entries_) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has(const std::string& name) const {
        for (const auto& entry : entries_) {
            if (strcasecmp(entry.first.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }

    const std::vector<Entry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * path is already percent-encoded; query parameters are encoded on
 * serialisation so the signer and the wire see the same canonical form.
 *
 * Request format:
 * METHOD SP path[?query] SP HTTP/1.1 CRLF
 * Header-Name: Header-Value CRLF
 * CRLF
 * [body]
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path = "/";
    std::vector<std::pair<std::string, std::string>> query;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    /// path plus the encoded query string, as sent on the request line
    std::string target() const;

    /// "a=1&b=2" with keys sorted and values percent-encoded
    std::string canonical_query() const;

    /**
     * @brief Serialise to wire format
     *
     * Content-Length is always emitted (0 for an empty body) because the
     * service rejects bodiless POST and PUT requests without it.
     */
    std::vector<std::uint8_t> serialize() const;

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }
};

/**
 * @brief Incoming HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const { return headers.get(name); }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "GET";
    }
};

/**
 * @brief RFC 3986 percent-encoding as required by request signing
 *
 * Unreserved characters (A-Z a-z 0-9 - _ . ~) pass through; when
 * encode_slash is false '/' also passes through (path segments).
 */
std::string uri_encode(const std::string& text, bool encode_slash = true);

} // namespace gcli::remote
