#include "gcli/transfer/engine.hpp"

#include "gcli/transfer/tree_hash.hpp"
#include "gcli/transfer/windowed_reader.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace gcli::transfer {
namespace fs = std::filesystem;

TransferEngine::TransferEngine(remote::ArchiveService& service,
                               cache::ArchiveCache& cache,
                               std::uint64_t chunk_size)
    : service_(service), cache_(cache), chunk_size_(chunk_size) {}

Result<UploadReceipt> TransferEngine::upload(const std::string& vault, const std::string& name, std::istream& source) {
    if (auto valid = validate_chunk_size(chunk_size_); valid.is_error()) {
        return Err<UploadReceipt>(valid.error());
    }

    source.clear();
    source.seekg(0, std::ios::end);
    const auto end_pos = source.tellg();
    if (!source || end_pos < 0) {
        return Err<UploadReceipt>(ErrorKind::Usage, "Upload source must be a seekable file");
    }
    const auto size = static_cast<std::uint64_t>(end_pos);

    source.seekg(0, std::ios::beg);
    auto hash = tree_hash_stream(source);
    if (hash.is_error()) {
        return Err<UploadReceipt>(hash.error());
    }
    source.clear();
    source.seekg(0, std::ios::beg);

    UploadReceipt receipt;
    receipt.size = size;
    receipt.tree_hash = hash.value();

    spdlog::debug("Uploading archive with multipart size={}", chunk_size_);

    Result<remote::UploadedArchive> uploaded = Err<remote::UploadedArchive>(ErrorKind::DataError, "not uploaded");
    if (size < chunk_size_) {
        spdlog::debug("Uploading in single upload");
        auto body = WindowedReader::create(source, 0, size);
        if (body.is_error()) {
            return Err<UploadReceipt>(body.error());
        }
        uploaded = service_.upload_archive(vault, name, body.value(), receipt.tree_hash);
    } else {
        spdlog::debug("Uploading in multi-part upload");
        uploaded = upload_multipart(vault, name, source, size, receipt.tree_hash, receipt.parts);
    }

    if (uploaded.is_error()) {
        return Err<UploadReceipt>(uploaded.error());
    }
    receipt.archive_id = uploaded.value().archive_id;

    if (auto recorded = cache_.record_upload(vault, name, receipt.archive_id, size); recorded.is_error()) {
        return Err<UploadReceipt>(recorded.error());
    }
    return Ok(std::move(receipt));
}

Result<remote::UploadedArchive> TransferEngine::upload_multipart(const std::string& vault,
                                                                 const std::string& name,
                                                                 std::istream& source,
                                                                 std::uint64_t size,
                                                                 const std::string& tree_hash,
                                                                 std::size_t& parts) {
    auto upload_id = service_.initiate_multipart_upload(vault, name, chunk_size_);
    if (upload_id.is_error()) {
        return Err<remote::UploadedArchive>(upload_id.error());
    }

    auto abort_and_fail = [&](const Error& error) {
        spdlog::warn("Multipart upload failed: {}", error.message);
        if (auto aborted = service_.abort_multipart_upload(vault, upload_id.value()); aborted.is_error()) {
            spdlog::warn("Failed to abort multipart upload {}: {}", upload_id.value(), aborted.error().message);
        } else {
            spdlog::debug("Multipart upload aborted");
        }
        return Err<remote::UploadedArchive>(error);
    };

    const auto ranges = plan_chunks(size, chunk_size_);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        const auto& range = ranges[i];
        spdlog::debug("Uploading bytes {}-{} (Chunk {} of {})", range.start, range.end - 1, i + 1, ranges.size());

        auto part = WindowedReader::create(source, range.start, range.end);
        if (part.is_error()) {
            return abort_and_fail(part.error());
        }
        if (auto sent = service_.upload_part(vault, upload_id.value(), range, part.value()); sent.is_error()) {
            return abort_and_fail(sent.error());
        }
        ++parts;
    }

    auto completed = service_.complete_multipart_upload(vault, upload_id.value(), size, tree_hash);
    if (completed.is_error()) {
        return abort_and_fail(completed.error());
    }
    spdlog::debug("Multipart upload complete");
    return completed;
}

Result<std::size_t> TransferEngine::fetch(const std::string& vault,
                                          const remote::JobDescription& job,
                                          const ChunkSink& sink) {
    if (auto valid = validate_chunk_size(chunk_size_); valid.is_error()) {
        return Err<std::size_t>(valid.error());
    }

    if (job.archive_size <= chunk_size_) {
        spdlog::debug("Fetching entire byte range");
        auto data = service_.get_job_output(vault, job.id, std::nullopt);
        if (data.is_error()) {
            return Err<std::size_t>(data.error());
        }
        if (auto written = sink(0, data.value()); written.is_error()) {
            return Err<std::size_t>(written.error());
        }
        return Ok(std::size_t{1});
    }

    const auto ranges = plan_chunks(job.archive_size, chunk_size_);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        const auto& range = ranges[i];
        spdlog::debug("Fetching multipart byte range {}-{} (Chunk {} of {})",
                      range.start, range.end - 1, i + 1, ranges.size());
        auto data = service_.get_job_output(vault, job.id, range);
        if (data.is_error()) {
            return Err<std::size_t>(data.error());
        }
        if (auto written = sink(range.start, data.value()); written.is_error()) {
            return Err<std::size_t>(written.error());
        }
    }
    return Ok(ranges.size());
}

Result<DownloadReceipt> TransferEngine::download_to_file(const std::string& vault,
                                                         const remote::JobDescription& job,
                                                         const fs::path& destination) {
    std::fstream file;
    if (fs::exists(destination)) {
        file.open(destination, std::ios::in | std::ios::out | std::ios::binary);
    } else {
        file.open(destination, std::ios::out | std::ios::binary | std::ios::trunc);
    }
    if (!file) {
        return Err<DownloadReceipt>(ErrorKind::DataError, "Failed to open output file: " + destination.string());
    }

    DownloadReceipt receipt;
    auto sink = [&](std::uint64_t offset, const std::vector<std::uint8_t>& data) -> Result<void> {
        file.seekp(static_cast<std::streamoff>(offset));
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file) {
            return Err<void>(ErrorKind::DataError, "Failed to write " + destination.string());
        }
        receipt.bytes_written += data.size();
        return Ok();
    };

    auto requests = fetch(vault, job, sink);
    if (requests.is_error()) {
        return Err<DownloadReceipt>(requests.error());
    }
    receipt.requests = requests.value();

    file.flush();
    file.close();

    // A pre-existing longer file must end exactly where the archive does
    std::error_code ec;
    fs::resize_file(destination, job.archive_size, ec);
    if (ec) {
        return Err<DownloadReceipt>(ErrorKind::DataError,
                                    "Failed to truncate " + destination.string() + ": " + ec.message());
    }

    std::ifstream written(destination, std::ios::binary);
    if (!written) {
        return Err<DownloadReceipt>(ErrorKind::DataError, "Failed to reopen " + destination.string());
    }
    auto computed = tree_hash_stream(written);
    if (computed.is_error()) {
        return Err<DownloadReceipt>(computed.error());
    }
    if (computed.value() != job.sha256_tree_hash) {
        return Err<DownloadReceipt>(ErrorKind::Integrity,
                                    "SHA256 tree hash does not match archive (expected " + job.sha256_tree_hash +
                                    ", computed " + computed.value() + "). Download is likely corrupt.");
    }

    receipt.verified = true;
    return Ok(receipt);
}

Result<DownloadReceipt> TransferEngine::download_to_stream(const std::string& vault,
                                                           const remote::JobDescription& job,
                                                           std::ostream& destination) {
    DownloadReceipt receipt;
    auto sink = [&](std::uint64_t, const std::vector<std::uint8_t>& data) -> Result<void> {
        destination.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!destination) {
            return Err<void>(ErrorKind::DataError, "Failed to write archive to output stream");
        }
        receipt.bytes_written += data.size();
        return Ok();
    };

    auto requests = fetch(vault, job, sink);
    if (requests.is_error()) {
        return Err<DownloadReceipt>(requests.error());
    }
    receipt.requests = requests.value();
    destination.flush();

    spdlog::warn("File saved to stdout cannot have its SHA256 tree hash verified");
    return Ok(receipt);
}

} // namespace gcli::transfer
