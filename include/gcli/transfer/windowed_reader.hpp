#pragma once

#include "gcli/core/result.hpp"

#include <cstdint>
#include <istream>
#include <vector>

namespace gcli::transfer {

enum class SeekOrigin {
    Begin,    // Relative to window start
    Current,  // Relative to the reader's own cursor
    End       // Relative to window end (not the underlying stream's end)
};

/**
 * @brief Read-only view of the absolute byte window [start, end) of a stream
 *
 * The reader keeps its own cursor and repositions the underlying stream
 * before every read, so several readers over one stream may be used in any
 * interleaving without disturbing each other. Offsets given to seek() and
 * returned by tell() are window-relative.
 */
class WindowedReader {
public:
    static Result<WindowedReader> create(std::istream& stream, std::uint64_t start, std::uint64_t end);

    /**
     * @brief Read up to max_bytes, never crossing the window end
     *
     * Returns an empty buffer exactly at the window end.
     */
    Result<std::vector<std::uint8_t>> read(std::size_t max_bytes);

    /// Read everything between the cursor and the window end.
    Result<std::vector<std::uint8_t>> read_remaining();

    Result<void> seek(std::int64_t offset, SeekOrigin origin = SeekOrigin::Begin);

    /// Always fails: the reader mediates reads only.
    Result<void> write(const std::vector<std::uint8_t>& data);

    [[nodiscard]] std::uint64_t tell() const noexcept { return position_ - start_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return end_ - start_; }
    [[nodiscard]] std::uint64_t start() const noexcept { return start_; }
    [[nodiscard]] std::uint64_t end() const noexcept { return end_; }

private:
    WindowedReader(std::istream& stream, std::uint64_t start, std::uint64_t end);

    std::istream* stream_;
    std::uint64_t start_;
    std::uint64_t end_;
    std::uint64_t position_; ///< Absolute position in the underlying stream
};

} // namespace gcli::transfer
