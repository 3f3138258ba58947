#include "gcli/remote/http_types.hpp"

#include <algorithm>
#include <sstream>

namespace gcli::remote {

std::string uri_encode(const std::string& text, bool encode_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string HttpRequest::canonical_query() const {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query.size());
    for (const auto& [key, value] : query) {
        encoded.emplace_back(uri_encode(key), uri_encode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string out;
    for (const auto& [key, value] : encoded) {
        if (!out.empty()) {
            out += '&';
        }
        out += key + "=" + value;
    }
    return out;
}

std::string HttpRequest::target() const {
    if (query.empty()) {
        return path;
    }
    return path + "?" + canonical_query();
}

std::vector<std::uint8_t> HttpRequest::serialize() const {
    std::ostringstream oss;

    // Request line
    oss << HttpMethodUtils::to_string(method) << " " << target() << " HTTP/1.1\r\n";

    // Headers
    for (const auto& [name, value] : headers.entries()) {
        oss << name << ": " << value << "\r\n";
    }
    if (!headers.has("Content-Length")) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }

    // Empty line separates headers from body
    oss << "\r\n";

    std::string head = oss.str();
    std::vector<std::uint8_t> result(head.begin(), head.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace gcli::remote
