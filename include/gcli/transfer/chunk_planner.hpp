#pragma once

#include "gcli/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gcli::transfer {

/**
 * @brief Half-open absolute byte range [start, end)
 */
struct ChunkRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }

    /// "bytes=start-last" form used for ranged job output requests.
    [[nodiscard]] std::string http_range() const;

    /// "bytes start-last/*" form used for multipart part uploads.
    [[nodiscard]] std::string content_range() const;

    bool operator==(const ChunkRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
};

inline constexpr std::uint64_t kMinChunkSize = std::uint64_t{1} << 20;
inline constexpr std::uint64_t kMaxChunkSize = std::uint64_t{1} << 32;
inline constexpr std::uint64_t kDefaultUploadChunkSize = 32 * kMinChunkSize;
inline constexpr std::uint64_t kDefaultDownloadChunkSize = 8 * kMinChunkSize;

/**
 * @brief Accept only powers of two between 1 MiB and 4 GiB
 */
Result<void> validate_chunk_size(std::uint64_t chunk_size);

/**
 * @brief Ordered ranges covering [0, total_size)
 *
 * Every range is chunk_size long except a possibly shorter final one. An
 * empty input produces no ranges.
 */
std::vector<ChunkRange> plan_chunks(std::uint64_t total_size, std::uint64_t chunk_size);

} // namespace gcli::transfer
