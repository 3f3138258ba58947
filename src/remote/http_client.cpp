#include "gcli/remote/http_client.hpp"

#include "gcli/remote/http_response_parser.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace gcli::remote {

namespace {

Error transport_error(const std::string& what, const boost::system::error_code& ec) {
    return make_error(ErrorKind::Remote, what + ": " + ec.message());
}

} // namespace

HttpClient::HttpClient(Endpoint endpoint)
    : endpoint_(std::move(endpoint))
    , ssl_context_(asio::ssl::context::tls_client) {
    boost::system::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("Failed to load system certificate store: {}", ec.message());
    }
    ssl_context_.set_verify_mode(asio::ssl::verify_peer);
}

Result<tcp::resolver::results_type> HttpClient::resolve() {
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), ec);
    if (ec) {
        return Err<tcp::resolver::results_type>(transport_error("Failed to resolve " + endpoint_.host, ec));
    }
    return Ok(std::move(results));
}

template <typename Stream>
Result<HttpResponse> HttpClient::exchange(Stream& stream, const HttpRequest& request) {
    boost::system::error_code ec;

    HttpRequest outgoing = request;
    if (!outgoing.headers.has("Host")) {
        outgoing.headers.set("Host", endpoint_.host);
    }
    outgoing.headers.set("Connection", "close");

    const std::vector<std::uint8_t> data = outgoing.serialize();
    asio::write(stream, asio::buffer(data), ec);
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to send request", ec));
    }

    HttpResponseParser parser;
    parser.expect_no_body(request.method == HttpMethod::HEAD);

    std::array<char, 65536> buffer;
    for (;;) {
        const std::size_t n = stream.read_some(asio::buffer(buffer), ec);
        if (n > 0) {
            auto parsed = parser.parse(buffer.data(), n);
            if (parsed.is_error()) {
                return Err<HttpResponse>(parsed.error());
            }
            if (parsed.value()) {
                break;
            }
        }
        // TLS peers frequently close without close_notify; treat it as EOF
        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }
        if (ec) {
            return Err<HttpResponse>(transport_error("Failed to read response", ec));
        }
    }

    HttpResponse response = parser.take_response();
    spdlog::debug("{} {} -> {} ({} bytes)",
                  HttpMethodUtils::to_string(request.method), request.path,
                  response.status_code, response.body.size());
    return Ok(std::move(response));
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    auto endpoints = resolve();
    if (endpoints.is_error()) {
        return Err<HttpResponse>(endpoints.error());
    }

    boost::system::error_code ec;
    if (!endpoint_.use_tls) {
        tcp::socket socket(io_context_);
        asio::connect(socket, endpoints.value(), ec);
        if (ec) {
            return Err<HttpResponse>(transport_error("Failed to connect to " + endpoint_.host, ec));
        }
        auto response = exchange(socket, request);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    asio::ssl::stream<tcp::socket> stream(io_context_, ssl_context_);

    // SNI and hostname verification
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        return Err<HttpResponse>(ErrorKind::Remote, "Failed to set TLS server name for " + endpoint_.host);
    }
    stream.set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));

    asio::connect(stream.next_layer(), endpoints.value(), ec);
    if (ec) {
        return Err<HttpResponse>(transport_error("Failed to connect to " + endpoint_.host, ec));
    }
    stream.handshake(asio::ssl::stream_base::client, ec);
    if (ec) {
        return Err<HttpResponse>(transport_error("TLS handshake with " + endpoint_.host + " failed", ec));
    }

    auto response = exchange(stream, request);

    // The response is already complete; a failed shutdown is only noise
    stream.shutdown(ec);
    if (ec && ec != asio::error::eof && ec != asio::ssl::error::stream_truncated) {
        spdlog::debug("TLS shutdown: {}", ec.message());
    }
    return response;
}

} // namespace gcli::remote
