#include "gcli/transfer/chunk_planner.hpp"

#include <algorithm>

namespace gcli::transfer {

std::string ChunkRange::http_range() const {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end - 1);
}

std::string ChunkRange::content_range() const {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end - 1) + "/*";
}

Result<void> validate_chunk_size(std::uint64_t chunk_size) {
    const bool power_of_two = chunk_size != 0 && (chunk_size & (chunk_size - 1)) == 0;
    if (!power_of_two || chunk_size < kMinChunkSize || chunk_size > kMaxChunkSize) {
        return Err<void>(ErrorKind::Usage,
                         "Part size must be a power of two and be between 1048576 and 4294967296 bytes "
                         "(got " + std::to_string(chunk_size) + ")");
    }
    return Ok();
}

std::vector<ChunkRange> plan_chunks(std::uint64_t total_size, std::uint64_t chunk_size) {
    std::vector<ChunkRange> ranges;
    if (total_size == 0 || chunk_size == 0) {
        return ranges;
    }

    ranges.reserve(static_cast<std::size_t>((total_size + chunk_size - 1) / chunk_size));
    for (std::uint64_t start = 0; start < total_size; start += chunk_size) {
        ranges.push_back(ChunkRange{start, std::min(start + chunk_size, total_size)});
    }
    return ranges;
}

} // namespace gcli::transfer
