#pragma once

#include "gcli/core/time.hpp"
#include "gcli/remote/http_types.hpp"

#include <string>

namespace gcli::remote {

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token;  ///< Optional, for temporary credentials

    bool empty() const { return access_key.empty() || secret_key.empty(); }
};

/**
 * @brief AWS Signature Version 4 request signer
 *
 * sign() adds X-Amz-Date, X-Amz-Content-Sha256 (when absent), an optional
 * X-Amz-Security-Token and the Authorization header. Every header present on
 * the request at signing time is signed, so Host must already be set.
 */
class SigV4Signer {
public:
    SigV4Signer(Credentials credentials, std::string region, std::string service);

    void sign(HttpRequest& request, Timestamp now) const;

    /// Canonical request text; exposed for tests against published vectors.
    static std::string canonical_request(const HttpRequest& request, const std::string& payload_hash);

    std::string string_to_sign(const std::string& amz_date, const std::string& canonical) const;

    std::string signature(const std::string& date, const std::string& string_to_sign) const;

private:
    std::string scope(const std::string& date) const;

    Credentials credentials_;
    std::string region_;
    std::string service_;
};

/// Lowercase hex SHA-256 of a buffer.
std::string sha256_hex(const std::vector<std::uint8_t>& data);
std::string sha256_hex(const std::string& data);

} // namespace gcli::remote
