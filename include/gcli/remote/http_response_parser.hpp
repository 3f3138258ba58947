#pragma once

#include "gcli/core/result.hpp"
#include "gcli/remote/http_types.hpp"

#include <cstddef>
#include <string>

namespace gcli::remote {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,            // Content-Length delimited
    BODY_UNTIL_CLOSE,
    CHUNK_SIZE,
    CHUNK_EXTENSION,
    CHUNK_DATA,
    CHUNK_DATA_END,  // CRLF after chunk data
    TRAILER,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Data can be fed in arbitrary pieces as it arrives from the socket. The
 * head is parsed character by character; body bytes are copied in bulk.
 *
 * Usage:
 * ```cpp
 * HttpResponseParser parser;
 * parser.expect_no_body(request.method == HttpMethod::HEAD);
 * while (!done) {
 *     auto n = socket.read_some(buffer, ec);
 *     if (ec == eof) { parser.finish(); break; }
 *     auto result = parser.parse(buffer.data(), n);
 *     ...
 * }
 * HttpResponse response = parser.take_response();
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @brief Parse incoming data
     *
     * @return true once the response is complete, false if more data is
     *         needed, or a DataError for a malformed response
     */
    Result<bool> parse(const char* data, std::size_t len);

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a close-delimited body. A close anywhere else before the
     * response is complete is a DataError.
     */
    Result<bool> finish();

    /// Responses to HEAD requests carry headers only.
    void expect_no_body(bool no_body) { no_body_ = no_body; }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    const HttpResponse& response() const { return response_; }
    HttpResponse take_response() { return std::move(response_); }

    void reset();

private:
    bool parse_version(char c);
    bool parse_status_code(char c);
    bool parse_reason(char c);
    bool parse_header_name(char c);
    bool parse_header_value(char c);
    bool parse_chunk_size(char c);
    bool parse_chunk_extension(char c);
    bool parse_chunk_data_end(char c);
    bool parse_trailer(char c);

    /// Decide how the body is delimited once the headers are complete.
    bool begin_body();

    Result<bool> fail(const std::string& what);

    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t body_remaining_;
    std::size_t line_;
    bool last_char_was_cr_;
    bool no_body_ = false;
};

} // namespace gcli::remote
