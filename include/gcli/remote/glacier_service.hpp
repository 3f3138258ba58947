#pragma once

#include "gcli/core/time.hpp"
#include "gcli/remote/archive_service.hpp"
#include "gcli/remote/http_client.hpp"
#include "gcli/remote/sigv4.hpp"

#include <memory>
#include <string>

namespace gcli::remote {

/**
 * @brief ArchiveService backed by the Glacier REST API (version 2012-06-01)
 *
 * Every call is one signed request on the transport. 2xx responses are
 * decoded; a 404 becomes NotFound and anything else a Remote error carrying
 * the service's message.
 */
class GlacierService : public ArchiveService {
public:
    struct Options {
        std::string region = "us-east-1";
        std::string host;              ///< Defaults to glacier.<region>.amazonaws.com
        std::string account_id = "-";  ///< "-" is the account owning the credentials
        Credentials credentials;
    };

    GlacierService(Options options, std::unique_ptr<HttpTransport> transport, Clock clock = system_now);

    /// Service over HTTPS to options.host (port 443).
    static std::unique_ptr<GlacierService> connect(Options options);

    Result<std::vector<VaultDescription>> list_vaults() override;
    Result<void> create_vault(const std::string& vault) override;
    Result<void> delete_vault(const std::string& vault) override;

    Result<std::vector<JobDescription>> list_jobs(const std::string& vault) override;
    Result<JobDescription> describe_job(const std::string& vault, const std::string& job_id) override;
    Result<std::string> initiate_archive_retrieval(const std::string& vault, const std::string& archive_id) override;
    Result<std::string> initiate_inventory_retrieval(const std::string& vault) override;
    Result<std::vector<std::uint8_t>> get_job_output(const std::string& vault,
                                                     const std::string& job_id,
                                                     const std::optional<transfer::ChunkRange>& range) override;

    Result<UploadedArchive> upload_archive(const std::string& vault,
                                           const std::string& description,
                                           transfer::WindowedReader& body,
                                           const std::string& tree_hash) override;
    Result<std::string> initiate_multipart_upload(const std::string& vault,
                                                  const std::string& description,
                                                  std::uint64_t part_size) override;
    Result<void> upload_part(const std::string& vault,
                             const std::string& upload_id,
                             const transfer::ChunkRange& range,
                             transfer::WindowedReader& body) override;
    Result<UploadedArchive> complete_multipart_upload(const std::string& vault,
                                                      const std::string& upload_id,
                                                      std::uint64_t archive_size,
                                                      const std::string& tree_hash) override;
    Result<void> abort_multipart_upload(const std::string& vault, const std::string& upload_id) override;

    Result<void> delete_archive(const std::string& vault, const std::string& archive_id) override;

    const Options& options() const { return options_; }

private:
    HttpRequest make_request(HttpMethod method, const std::string& path) const;

    /// "/<account>/vaults/<vault>" followed by suffix
    std::string vault_path(const std::string& vault, const std::string& suffix = "") const;

    /// Sign, send and check the status; non-2xx responses become errors.
    Result<HttpResponse> execute(HttpRequest request, const std::string& what);

    Result<std::string> initiate_job(const std::string& vault, const std::string& body);

    Options options_;
    std::unique_ptr<HttpTransport> transport_;
    SigV4Signer signer_;
    Clock clock_;
};

} // namespace gcli::remote
