#include "gcli/remote/sigv4.hpp"

#include "gcli/transfer/tree_hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <map>

namespace gcli::remote {
namespace {

constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& message) {
    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(), out.data(), &len);
    out.resize(len);
    return out;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Trim and collapse runs of spaces as required for canonical header values
std::string canonical_value(const std::string& value) {
    std::string out;
    bool in_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            in_space = !out.empty();
            continue;
        }
        if (in_space) {
            out += ' ';
            in_space = false;
        }
        out += c;
    }
    return out;
}

} // namespace

std::string sha256_hex(const std::vector<std::uint8_t>& data) {
    const auto digest = transfer::sha256(data.data(), data.size());
    return transfer::to_hex(digest.data(), digest.size());
}

std::string sha256_hex(const std::string& data) {
    const auto digest = transfer::sha256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    return transfer::to_hex(digest.data(), digest.size());
}

SigV4Signer::SigV4Signer(Credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string SigV4Signer::canonical_request(const HttpRequest& request, const std::string& payload_hash) {
    std::map<std::string, std::string> headers;
    for (const auto& [name, value] : request.headers.entries()) {
        auto& slot = headers[to_lower(name)];
        slot = slot.empty() ? canonical_value(value) : slot + "," + canonical_value(value);
    }

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) {
            signed_headers += ';';
        }
        signed_headers += name;
    }

    return HttpMethodUtils::to_string(request.method) + "\n" +
           request.path + "\n" +
           request.canonical_query() + "\n" +
           canonical_headers + "\n" +
           signed_headers + "\n" +
           payload_hash;
}

std::string SigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string SigV4Signer::string_to_sign(const std::string& amz_date, const std::string& canonical) const {
    return std::string(kAlgorithm) + "\n" + amz_date + "\n" + scope(amz_date.substr(0, 8)) + "\n" +
           sha256_hex(canonical);
}

std::string SigV4Signer::signature(const std::string& date, const std::string& to_sign) const {
    const std::string secret = "AWS4" + credentials_.secret_key;
    auto key = hmac_sha256(std::vector<std::uint8_t>(secret.begin(), secret.end()), date);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    key = hmac_sha256(key, "aws4_request");
    const auto sig = hmac_sha256(key, to_sign);
    return transfer::to_hex(sig.data(), sig.size());
}

void SigV4Signer::sign(HttpRequest& request, Timestamp now) const {
    const std::string amz_date = format_basic_iso8601(now);
    const std::string date = amz_date.substr(0, 8);

    std::string payload_hash = request.headers.get("x-amz-content-sha256");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body);
        request.headers.set("x-amz-content-sha256", payload_hash);
    }
    request.headers.set("x-amz-date", amz_date);
    if (!credentials_.session_token.empty()) {
        request.headers.set("x-amz-security-token", credentials_.session_token);
    }

    const std::string canonical = canonical_request(request, payload_hash);
    const std::string to_sign = string_to_sign(amz_date, canonical);

    std::string signed_headers;
    {
        std::map<std::string, bool> names;
        for (const auto& entry : request.headers.entries()) {
            names[to_lower(entry.first)] = true;
        }
        for (const auto& entry : names) {
            if (!signed_headers.empty()) {
                signed_headers += ';';
            }
            signed_headers += entry.first;
        }
    }

    request.headers.set("Authorization",
                        std::string(kAlgorithm) + " Credential=" + credentials_.access_key + "/" + scope(date) +
                        ", SignedHeaders=" + signed_headers + ", Signature=" + signature(date, to_sign));
}

} // namespace gcli::remote
