#pragma once

#include "gcli/core/result.hpp"

#include <array>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace gcli::transfer {

using Digest = std::array<std::uint8_t, 32>;

inline constexpr std::size_t kTreeHashBlockSize = 1024 * 1024;

/**
 * @brief Incremental SHA-256 tree hash
 *
 * Content is split into 1 MiB blocks; each block is hashed, then adjacent
 * digests are hashed pairwise level by level until one root remains. An odd
 * digest at the end of a level is promoted unchanged.
 */
class TreeHasher {
public:
    void update(const std::uint8_t* data, std::size_t size);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    /// Root digest as lowercase hex. The hasher must not be reused afterwards.
    [[nodiscard]] std::string finish();

    [[nodiscard]] std::uint64_t bytes_hashed() const noexcept { return total_; }

private:
    void flush_block();

    std::vector<Digest> leaves_;
    std::vector<std::uint8_t> block_;
    std::uint64_t total_ = 0;
};

Digest sha256(const std::uint8_t* data, std::size_t size);

std::string to_hex(const std::uint8_t* data, std::size_t size);

std::string tree_hash(const std::vector<std::uint8_t>& data);

/**
 * @brief Tree hash of everything from the stream's current position to EOF
 */
Result<std::string> tree_hash_stream(std::istream& stream);

} // namespace gcli::transfer
