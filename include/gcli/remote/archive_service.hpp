#pragma once

#include "gcli/core/result.hpp"
#include "gcli/core/time.hpp"
#include "gcli/transfer/chunk_planner.hpp"
#include "gcli/transfer/windowed_reader.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gcli::remote {

enum class JobAction {
    ArchiveRetrieval,
    InventoryRetrieval
};

enum class JobStatus {
    InProgress,
    Succeeded,
    Failed
};

/**
 * @brief Remote job as reported by the service; never persisted locally
 */
struct JobDescription {
    std::string id;
    JobAction action = JobAction::ArchiveRetrieval;
    JobStatus status = JobStatus::InProgress;
    bool completed = false;
    Timestamp creation_date = 0;
    std::optional<Timestamp> completion_date;
    std::string archive_id;                   ///< Empty for inventory jobs
    std::uint64_t archive_size = 0;
    std::string sha256_tree_hash;             ///< Whole-archive tree hash for retrievals
    std::string status_message;
};

struct VaultDescription {
    std::string name;
    std::string arn;
    Timestamp creation_date = 0;
    std::optional<Timestamp> last_inventory_date;
    std::uint64_t archive_count = 0;
    std::uint64_t size = 0;
};

/**
 * @brief Archive upload outcome (single request or completed multipart)
 */
struct UploadedArchive {
    std::string archive_id;
    std::string checksum;
};

/**
 * @brief Remote archive service primitives consumed by the client
 *
 * There is no "list archives" primitive: archive listings are
 * only available through inventory retrieval jobs.
 */
class ArchiveService {
public:
    virtual ~ArchiveService() = default;

    virtual Result<std::vector<VaultDescription>> list_vaults() = 0;
    virtual Result<void> create_vault(const std::string& vault) = 0;
    virtual Result<void> delete_vault(const std::string& vault) = 0;

    virtual Result<std::vector<JobDescription>> list_jobs(const std::string& vault) = 0;
    virtual Result<JobDescription> describe_job(const std::string& vault, const std::string& job_id) = 0;
    virtual Result<std::string> initiate_archive_retrieval(const std::string& vault,
                                                           const std::string& archive_id) = 0;
    virtual Result<std::string> initiate_inventory_retrieval(const std::string& vault) = 0;

    /// Whole job output when range is empty, otherwise the given byte range.
    virtual Result<std::vector<std::uint8_t>> get_job_output(const std::string& vault,
                                                             const std::string& job_id,
                                                             const std::optional<transfer::ChunkRange>& range) = 0;

    virtual Result<UploadedArchive> upload_archive(const std::string& vault,
                                                   const std::string& description,
                                                   transfer::WindowedReader& body,
                                                   const std::string& tree_hash) = 0;

    virtual Result<std::string> initiate_multipart_upload(const std::string& vault,
                                                          const std::string& description,
                                                          std::uint64_t part_size) = 0;
    virtual Result<void> upload_part(const std::string& vault,
                                     const std::string& upload_id,
                                     const transfer::ChunkRange& range,
                                     transfer::WindowedReader& body) = 0;
    virtual Result<UploadedArchive> complete_multipart_upload(const std::string& vault,
                                                              const std::string& upload_id,
                                                              std::uint64_t archive_size,
                                                              const std::string& tree_hash) = 0;
    virtual Result<void> abort_multipart_upload(const std::string& vault, const std::string& upload_id) = 0;

    virtual Result<void> delete_archive(const std::string& vault, const std::string& archive_id) = 0;
};

const char* to_string(JobAction action);
const char* to_string(JobStatus status);
Result<JobAction> parse_job_action(const std::string& text);
Result<JobStatus> parse_job_status(const std::string& text);

} // namespace gcli::remote
