#pragma once

#include "gcli/core/result.hpp"
#include "gcli/remote/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <cstdint>
#include <string>

namespace gcli::remote {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Sends one request and returns its response
 *
 * The seam between request signing and the network, so the service client
 * can be exercised against a scripted transport.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio
 *
 * Opens one connection per request (Connection: close), over TLS with peer
 * verification against the system trust store unless use_tls is false.
 * The Host header is filled in when the request does not carry one.
 */
class HttpClient : public HttpTransport {
public:
    struct Endpoint {
        std::string host;
        std::uint16_t port = 443;
        bool use_tls = true;
    };

    explicit HttpClient(Endpoint endpoint);

    Result<HttpResponse> send(const HttpRequest& request) override;

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Result<tcp::resolver::results_type> resolve();

    /**
     * @brief Write the request and read until the response is complete
     *
     * Stream is either a tcp::socket or an ssl::stream over one.
     */
    template <typename Stream>
    Result<HttpResponse> exchange(Stream& stream, const HttpRequest& request);

    Endpoint endpoint_;
    asio::io_context io_context_;
    asio::ssl::context ssl_context_;
};

} // namespace gcli::remote
