#pragma once

#include "gcli/cache/archive_cache.hpp"
#include "gcli/core/result.hpp"
#include "gcli/remote/archive_service.hpp"
#include "gcli/transfer/chunk_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <ostream>
#include <string>

namespace gcli::transfer {

struct UploadReceipt {
    std::string archive_id;
    std::uint64_t size = 0;
    std::string tree_hash;
    std::size_t parts = 0;   ///< 0 for a single-request upload
};

struct DownloadReceipt {
    std::uint64_t bytes_written = 0;
    std::size_t requests = 0;
    bool verified = false;
};

/**
 * @brief Moves archive content between local files and the archive service
 *
 * Content at or above the chunk size travels in chunk-sized parts; smaller
 * content in one request. Uploads are registered in the cache on success.
 * Downloads are verified against the job's tree hash whenever the
 * destination can be read back.
 *
 * Each request body is held in memory while it is signed and sent, so peak
 * memory grows with the chunk size: one chunk per request, up to 4 GiB at
 * kMaxChunkSize. Content small enough for a single request is below one
 * chunk.
 */
class TransferEngine {
public:
    TransferEngine(remote::ArchiveService& service,
                   cache::ArchiveCache& cache,
                   std::uint64_t chunk_size);

    /**
     * Upload a seekable source as a new archive named name. A failing
     * multipart sequence is aborted remotely before the error is returned.
     */
    Result<UploadReceipt> upload(const std::string& vault, const std::string& name, std::istream& source);

    /**
     * Write a completed retrieval job into destination, truncate it to the
     * archive size and verify the tree hash. A mismatch is an Integrity error.
     */
    Result<DownloadReceipt> download_to_file(const std::string& vault,
                                             const remote::JobDescription& job,
                                             const std::filesystem::path& destination);

    /// Same for a non-seekable stream: no truncation, verification skipped.
    Result<DownloadReceipt> download_to_stream(const std::string& vault,
                                               const remote::JobDescription& job,
                                               std::ostream& destination);

    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

private:
    using ChunkSink = std::function<Result<void>(std::uint64_t offset, const std::vector<std::uint8_t>& data)>;

    Result<remote::UploadedArchive> upload_multipart(const std::string& vault,
                                                     const std::string& name,
                                                     std::istream& source,
                                                     std::uint64_t size,
                                                     const std::string& tree_hash,
                                                     std::size_t& parts);

    Result<std::size_t> fetch(const std::string& vault, const remote::JobDescription& job, const ChunkSink& sink);

    remote::ArchiveService& service_;
    cache::ArchiveCache& cache_;
    std::uint64_t chunk_size_;
};

} // namespace gcli::transfer
