#include "gcli/remote/http_response_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <strings.h>

namespace gcli::remote {

namespace {

// Upper bound on the body storage reserved up front from a declared length
constexpr std::size_t kMaxBodyReserve = 16 * 1024 * 1024;

bool parse_length(const std::string& digits, int base, std::size_t& out) {
    if (digits.empty()) {
        return false;
    }
    const char* first = digits.data();
    const char* last = first + digits.size();
    const auto [end, ec] = std::from_chars(first, last, out, base);
    return ec == std::errc() && end == last;
}

} // namespace

void HttpResponseParser::reset() {
    state_ = ResponseParseState::VERSION;
    response_ = HttpResponse();
    buffer_.clear();
    current_header_name_.clear();
    body_remaining_ = 0;
    line_ = 1;
    last_char_was_cr_ = false;
}

Result<bool> HttpResponseParser::fail(const std::string& what) {
    state_ = ResponseParseState::PARSE_ERROR;
    return Err<bool>(ErrorKind::DataError, "Malformed HTTP response: " + what + " at line " + std::to_string(line_));
}

Result<bool> HttpResponseParser::parse(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        // Body bytes are copied in bulk rather than one character at a time
        if (state_ == ResponseParseState::BODY || state_ == ResponseParseState::CHUNK_DATA) {
            const std::size_t n = std::min(body_remaining_, len - i);
            response_.body.insert(response_.body.end(), data + i, data + i + n);
            body_remaining_ -= n;
            i += n;
            if (body_remaining_ == 0) {
                state_ = state_ == ResponseParseState::BODY ? ResponseParseState::COMPLETE
                                                            : ResponseParseState::CHUNK_DATA_END;
            }
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
            continue;
        }
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            response_.body.insert(response_.body.end(), data + i, data + len);
            return Ok(false);
        }

        const char c = data[i++];
        if (c == '\n') {
            line_++;
        }

        bool ok = true;
        switch (state_) {
            case ResponseParseState::VERSION: ok = parse_version(c); break;
            case ResponseParseState::STATUS_CODE: ok = parse_status_code(c); break;
            case ResponseParseState::REASON: ok = parse_reason(c); break;
            case ResponseParseState::HEADER_NAME: ok = parse_header_name(c); break;
            case ResponseParseState::HEADER_VALUE: ok = parse_header_value(c); break;
            case ResponseParseState::CHUNK_SIZE: ok = parse_chunk_size(c); break;
            case ResponseParseState::CHUNK_EXTENSION: ok = parse_chunk_extension(c); break;
            case ResponseParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); break;
            case ResponseParseState::TRAILER: ok = parse_trailer(c); break;
            case ResponseParseState::COMPLETE: return Ok(true);
            case ResponseParseState::PARSE_ERROR: return Err<bool>(ErrorKind::DataError, "Parser in error state");
            default: break;
        }
        if (!ok) {
            return fail("unexpected character");
        }
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
    }
    return Ok(state_ == ResponseParseState::COMPLETE);
}

Result<bool> HttpResponseParser::finish() {
    if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
        state_ = ResponseParseState::COMPLETE;
    }
    if (state_ == ResponseParseState::COMPLETE) {
        return Ok(true);
    }
    return Err<bool>(ErrorKind::DataError, "Connection closed before the response was complete");
}

bool HttpResponseParser::parse_version(char c) {
    if (c == ' ') {
        if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
            return false;
        }
        buffer_.clear();
        state_ = ResponseParseState::STATUS_CODE;
        return true;
    }
    if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() > 8) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_status_code(char c) {
    if (c == ' ' || c == '\r') {
        if (buffer_.size() != 3) {
            return false;
        }
        response_.status_code = std::stoi(buffer_);
        buffer_.clear();
        last_char_was_cr_ = c == '\r';
        state_ = ResponseParseState::REASON;
        return true;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_reason(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        response_.reason_phrase = buffer_;
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ResponseParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_header_name(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (!buffer_.empty()) {
            return false;
        }
        return begin_body();
    }
    last_char_was_cr_ = false;

    if (c == ':') {
        if (buffer_.empty()) {
            return false;
        }
        current_header_name_ = buffer_;
        buffer_.clear();
        state_ = ResponseParseState::HEADER_VALUE;
        return true;
    }

    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_header_value(char c) {
    // Skip leading whitespace after colon
    if (buffer_.empty() && (c == ' ' || c == '\t')) {
        return true;
    }
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
            buffer_.pop_back();
        }
        response_.headers.set(current_header_name_, buffer_);
        buffer_.clear();
        current_header_name_.clear();
        last_char_was_cr_ = false;
        state_ = ResponseParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpResponseParser::begin_body() {
    const int status = response_.status_code;
    if (no_body_ || status == 204 || status == 304 || (status >= 100 && status < 200)) {
        state_ = ResponseParseState::COMPLETE;
        return true;
    }

    if (strcasecmp(response_.get_header("Transfer-Encoding").c_str(), "chunked") == 0) {
        state_ = ResponseParseState::CHUNK_SIZE;
        return true;
    }

    const std::string content_length = response_.get_header("Content-Length");
    if (!content_length.empty()) {
        if (!parse_length(content_length, 10, body_remaining_)) {
            return false;
        }
        if (body_remaining_ == 0) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }
        response_.body.reserve(std::min(body_remaining_, kMaxBodyReserve));
        state_ = ResponseParseState::BODY;
        return true;
    }

    state_ = ResponseParseState::BODY_UNTIL_CLOSE;
    return true;
}

bool HttpResponseParser::parse_chunk_size(char c) {
    if (c == ';' || c == ' ') {
        state_ = ResponseParseState::CHUNK_EXTENSION;
        return !buffer_.empty();
    }
    if (c == '\r') {
        last_char_was_cr_ = true;
        return !buffer_.empty();
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (!parse_length(buffer_, 16, body_remaining_)) {
            return false;
        }
        buffer_.clear();
        state_ = body_remaining_ == 0 ? ResponseParseState::TRAILER : ResponseParseState::CHUNK_DATA;
        return true;
    }
    if (!std::isxdigit(static_cast<unsigned char>(c)) || buffer_.size() >= 16) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_chunk_extension(char c) {
    // Extensions are ignored; only the line end matters
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (!parse_length(buffer_, 16, body_remaining_)) {
            return false;
        }
        buffer_.clear();
        state_ = body_remaining_ == 0 ? ResponseParseState::TRAILER : ResponseParseState::CHUNK_DATA;
        return true;
    }
    last_char_was_cr_ = false;
    return true;
}

bool HttpResponseParser::parse_chunk_data_end(char c) {
    if (c == '\r' && !last_char_was_cr_) {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        state_ = ResponseParseState::CHUNK_SIZE;
        return true;
    }
    return false;
}

bool HttpResponseParser::parse_trailer(char c) {
    // Trailer headers are discarded; an empty line ends the message
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (buffer_.empty()) {
            state_ = ResponseParseState::COMPLETE;
        }
        buffer_.clear();
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

} // namespace gcli::remote
