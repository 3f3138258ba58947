#include "gcli/remote/glacier_service.hpp"

#include "gcli/remote/codec.hpp"
#include "gcli/transfer/tree_hash.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gcli::remote {
using json = nlohmann::json;

namespace {

constexpr const char* kApiVersion = "2012-06-01";
constexpr const char* kServiceName = "glacier";

std::string default_host(const std::string& region) {
    return "glacier." + region + ".amazonaws.com";
}

// Paginated listings return {"<List>": [...], "Marker": "..."|null}
template <typename T, typename Decode>
Result<void> decode_page(const HttpResponse& response,
                         const char* list_key,
                         Decode decode,
                         std::vector<T>& items,
                         std::string& marker) {
    auto parsed = parse_json(response.body);
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }
    const auto& doc = parsed.value();
    const auto list = doc.find(list_key);
    if (list == doc.end() || !list->is_array()) {
        return Err<void>(ErrorKind::DataError, std::string("Response without ") + list_key);
    }
    for (const auto& entry : *list) {
        auto item = decode(entry);
        if (item.is_error()) {
            return Err<void>(item.error());
        }
        items.push_back(std::move(item.value()));
    }
    const auto next = doc.find("Marker");
    marker = next != doc.end() && next->is_string() ? next->template get<std::string>() : "";
    return Ok();
}

} // namespace

GlacierService::GlacierService(Options options, std::unique_ptr<HttpTransport> transport, Clock clock)
    : options_(std::move(options))
    , transport_(std::move(transport))
    , signer_(options_.credentials, options_.region, kServiceName)
    , clock_(std::move(clock)) {
    if (options_.host.empty()) {
        options_.host = default_host(options_.region);
    }
}

std::unique_ptr<GlacierService> GlacierService::connect(Options options) {
    if (options.host.empty()) {
        options.host = default_host(options.region);
    }
    auto client = std::make_unique<HttpClient>(HttpClient::Endpoint{options.host, 443, true});
    return std::make_unique<GlacierService>(std::move(options), std::move(client));
}

HttpRequest GlacierService::make_request(HttpMethod method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.headers.set("Host", options_.host);
    request.headers.set("x-amz-glacier-version", kApiVersion);
    return request;
}

std::string GlacierService::vault_path(const std::string& vault, const std::string& suffix) const {
    return "/" + uri_encode(options_.account_id) + "/vaults/" + uri_encode(vault) + suffix;
}

Result<HttpResponse> GlacierService::execute(HttpRequest request, const std::string& what) {
    signer_.sign(request, clock_());

    auto response = transport_->send(request);
    if (response.is_error()) {
        return Err<HttpResponse>(make_error(ErrorKind::Remote, what + ": " + response.error().message));
    }

    const HttpResponse& r = response.value();
    if (r.is_success()) {
        return response;
    }

    std::string message = error_message_from_body(r.body);
    if (message.empty()) {
        message = r.reason_phrase;
    }
    spdlog::debug("{} failed with HTTP {}: {}", what, r.status_code, message);
    if (r.status_code == 404) {
        return Err<HttpResponse>(ErrorKind::NotFound, what + ": " + message);
    }
    return Err<HttpResponse>(ErrorKind::Remote,
                             what + " (HTTP " + std::to_string(r.status_code) + "): " + message);
}

Result<std::vector<VaultDescription>> GlacierService::list_vaults() {
    std::vector<VaultDescription> vaults;
    std::string marker;
    do {
        auto request = make_request(HttpMethod::GET, "/" + uri_encode(options_.account_id) + "/vaults");
        if (!marker.empty()) {
            request.query.emplace_back("marker", marker);
        }
        auto response = execute(std::move(request), "Failed to list vaults");
        if (response.is_error()) {
            return Err<std::vector<VaultDescription>>(response.error());
        }
        auto page = decode_page<VaultDescription>(response.value(), "VaultList", vault_from_json, vaults, marker);
        if (page.is_error()) {
            return Err<std::vector<VaultDescription>>(page.error());
        }
    } while (!marker.empty());
    return Ok(std::move(vaults));
}

Result<void> GlacierService::create_vault(const std::string& vault) {
    auto response = execute(make_request(HttpMethod::PUT, vault_path(vault)), "Failed to create vault '" + vault + "'");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<void> GlacierService::delete_vault(const std::string& vault) {
    auto response = execute(make_request(HttpMethod::DELETE_METHOD, vault_path(vault)),
                            "Failed to delete vault '" + vault + "'");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<std::vector<JobDescription>> GlacierService::list_jobs(const std::string& vault) {
    std::vector<JobDescription> jobs;
    std::string marker;
    do {
        auto request = make_request(HttpMethod::GET, vault_path(vault, "/jobs"));
        if (!marker.empty()) {
            request.query.emplace_back("marker", marker);
        }
        auto response = execute(std::move(request), "Failed to list jobs on '" + vault + "'");
        if (response.is_error()) {
            return Err<std::vector<JobDescription>>(response.error());
        }
        auto page = decode_page<JobDescription>(response.value(), "JobList", job_from_json, jobs, marker);
        if (page.is_error()) {
            return Err<std::vector<JobDescription>>(page.error());
        }
    } while (!marker.empty());
    return Ok(std::move(jobs));
}

Result<JobDescription> GlacierService::describe_job(const std::string& vault, const std::string& job_id) {
    auto response = execute(make_request(HttpMethod::GET, vault_path(vault, "/jobs/" + uri_encode(job_id))),
                            "Failed to describe job " + job_id);
    if (response.is_error()) {
        return Err<JobDescription>(response.error());
    }
    auto parsed = parse_json(response.value().body);
    if (parsed.is_error()) {
        return Err<JobDescription>(parsed.error());
    }
    return job_from_json(parsed.value());
}

Result<std::string> GlacierService::initiate_job(const std::string& vault, const std::string& body) {
    auto request = make_request(HttpMethod::POST, vault_path(vault, "/jobs"));
    request.headers.set("Content-Type", "application/json");
    request.body.assign(body.begin(), body.end());

    auto response = execute(std::move(request), "Failed to initiate job on '" + vault + "'");
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    const std::string job_id = response.value().get_header("x-amz-job-id");
    if (job_id.empty()) {
        return Err<std::string>(ErrorKind::DataError, "Job initiation response without x-amz-job-id");
    }
    return Ok(job_id);
}

Result<std::string> GlacierService::initiate_archive_retrieval(const std::string& vault,
                                                               const std::string& archive_id) {
    const json body = {{"Type", "archive-retrieval"}, {"ArchiveId", archive_id}};
    return initiate_job(vault, body.dump());
}

Result<std::string> GlacierService::initiate_inventory_retrieval(const std::string& vault) {
    const json body = {{"Type", "inventory-retrieval"}, {"Format", "JSON"}};
    return initiate_job(vault, body.dump());
}

Result<std::vector<std::uint8_t>> GlacierService::get_job_output(const std::string& vault,
                                                                 const std::string& job_id,
                                                                 const std::optional<transfer::ChunkRange>& range) {
    auto request = make_request(HttpMethod::GET, vault_path(vault, "/jobs/" + uri_encode(job_id) + "/output"));
    if (range) {
        request.headers.set("Range", range->http_range());
    }
    auto response = execute(std::move(request), "Failed to fetch output of job " + job_id);
    if (response.is_error()) {
        return Err<std::vector<std::uint8_t>>(response.error());
    }
    auto& body = response.value().body;
    if (range && body.size() != range->length()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::DataError,
                                              "Short read of job output: expected " + std::to_string(range->length()) +
                                              " bytes, got " + std::to_string(body.size()));
    }
    return Ok(std::move(body));
}

Result<UploadedArchive> GlacierService::upload_archive(const std::string& vault,
                                                       const std::string& description,
                                                       transfer::WindowedReader& body,
                                                       const std::string& tree_hash) {
    auto data = body.read_remaining();
    if (data.is_error()) {
        return Err<UploadedArchive>(data.error());
    }

    auto request = make_request(HttpMethod::POST, vault_path(vault, "/archives"));
    request.headers.set("x-amz-archive-description", description);
    request.headers.set("x-amz-sha256-tree-hash", tree_hash);
    request.headers.set("x-amz-content-sha256", sha256_hex(data.value()));
    request.body = std::move(data.value());

    auto response = execute(std::move(request), "Failed to upload archive to '" + vault + "'");
    if (response.is_error()) {
        return Err<UploadedArchive>(response.error());
    }
    UploadedArchive archive;
    archive.archive_id = response.value().get_header("x-amz-archive-id");
    archive.checksum = response.value().get_header("x-amz-sha256-tree-hash");
    if (archive.archive_id.empty()) {
        return Err<UploadedArchive>(ErrorKind::DataError, "Upload response without x-amz-archive-id");
    }
    return Ok(std::move(archive));
}

Result<std::string> GlacierService::initiate_multipart_upload(const std::string& vault,
                                                              const std::string& description,
                                                              std::uint64_t part_size) {
    auto request = make_request(HttpMethod::POST, vault_path(vault, "/multipart-uploads"));
    request.headers.set("x-amz-archive-description", description);
    request.headers.set("x-amz-part-size", std::to_string(part_size));

    auto response = execute(std::move(request), "Failed to initiate multipart upload to '" + vault + "'");
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    const std::string upload_id = response.value().get_header("x-amz-multipart-upload-id");
    if (upload_id.empty()) {
        return Err<std::string>(ErrorKind::DataError, "Multipart initiation response without upload id");
    }
    return Ok(upload_id);
}

Result<void> GlacierService::upload_part(const std::string& vault,
                                         const std::string& upload_id,
                                         const transfer::ChunkRange& range,
                                         transfer::WindowedReader& body) {
    auto data = body.read_remaining();
    if (data.is_error()) {
        return Err<void>(data.error());
    }
    if (data.value().size() != range.length()) {
        return Err<void>(ErrorKind::DataError, "Short read while uploading " + range.content_range());
    }

    auto request = make_request(HttpMethod::PUT, vault_path(vault, "/multipart-uploads/" + uri_encode(upload_id)));
    request.headers.set("Content-Range", range.content_range());
    request.headers.set("x-amz-sha256-tree-hash", transfer::tree_hash(data.value()));
    request.headers.set("x-amz-content-sha256", sha256_hex(data.value()));
    request.body = std::move(data.value());

    auto response = execute(std::move(request), "Failed to upload part " + range.content_range());
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<UploadedArchive> GlacierService::complete_multipart_upload(const std::string& vault,
                                                                  const std::string& upload_id,
                                                                  std::uint64_t archive_size,
                                                                  const std::string& tree_hash) {
    auto request = make_request(HttpMethod::POST, vault_path(vault, "/multipart-uploads/" + uri_encode(upload_id)));
    request.headers.set("x-amz-sha256-tree-hash", tree_hash);
    request.headers.set("x-amz-archive-size", std::to_string(archive_size));

    auto response = execute(std::move(request), "Failed to complete multipart upload");
    if (response.is_error()) {
        return Err<UploadedArchive>(response.error());
    }
    UploadedArchive archive;
    archive.archive_id = response.value().get_header("x-amz-archive-id");
    archive.checksum = response.value().get_header("x-amz-sha256-tree-hash");
    if (archive.archive_id.empty()) {
        return Err<UploadedArchive>(ErrorKind::DataError, "Completion response without x-amz-archive-id");
    }
    return Ok(std::move(archive));
}

Result<void> GlacierService::abort_multipart_upload(const std::string& vault, const std::string& upload_id) {
    auto response = execute(
        make_request(HttpMethod::DELETE_METHOD, vault_path(vault, "/multipart-uploads/" + uri_encode(upload_id))),
        "Failed to abort multipart upload");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<void> GlacierService::delete_archive(const std::string& vault, const std::string& archive_id) {
    auto response = execute(
        make_request(HttpMethod::DELETE_METHOD, vault_path(vault, "/archives/" + uri_encode(archive_id))),
        "Failed to delete archive");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

} // namespace gcli::remote
