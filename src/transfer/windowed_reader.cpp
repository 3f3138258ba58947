#include "gcli/transfer/windowed_reader.hpp"

#include <algorithm>

namespace gcli::transfer {

WindowedReader::WindowedReader(std::istream& stream, std::uint64_t start, std::uint64_t end)
    : stream_(&stream), start_(start), end_(end), position_(start) {}

Result<WindowedReader> WindowedReader::create(std::istream& stream, std::uint64_t start, std::uint64_t end) {
    if (end < start) {
        return Err<WindowedReader>(ErrorKind::Usage,
                                   "Window end (" + std::to_string(end) + ") is before start (" +
                                   std::to_string(start) + ")");
    }
    return Ok(WindowedReader(stream, start, end));
}

Result<std::vector<std::uint8_t>> WindowedReader::read(std::size_t max_bytes) {
    std::vector<std::uint8_t> buffer;
    const std::uint64_t available = end_ - position_;
    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(max_bytes, available));
    if (wanted == 0) {
        return Ok(std::move(buffer));
    }

    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(position_), std::ios::beg);
    if (!*stream_) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::DataError,
                                              "Failed to position stream at offset " + std::to_string(position_));
    }

    buffer.resize(wanted);
    stream_->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
    const auto count = static_cast<std::size_t>(stream_->gcount());
    if (count < wanted && stream_->bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::DataError,
                                              "Read failed at offset " + std::to_string(position_));
    }

    buffer.resize(count);
    position_ += count;
    return Ok(std::move(buffer));
}

Result<std::vector<std::uint8_t>> WindowedReader::read_remaining() {
    return read(static_cast<std::size_t>(end_ - position_));
}

Result<void> WindowedReader::seek(std::int64_t offset, SeekOrigin origin) {
    std::int64_t base = 0;
    switch (origin) {
        case SeekOrigin::Begin: base = static_cast<std::int64_t>(start_); break;
        case SeekOrigin::Current: base = static_cast<std::int64_t>(position_); break;
        case SeekOrigin::End: base = static_cast<std::int64_t>(end_); break;
    }

    // base never exceeds end_, so the room left cannot overflow
    if (offset > static_cast<std::int64_t>(end_) - base) {
        return Err<void>(ErrorKind::SeekPastWindow,
                         "Attempted to seek past end of file window (" + std::to_string(offset) + ")");
    }
    const std::int64_t target = base + offset;
    if (target < static_cast<std::int64_t>(start_)) {
        return Err<void>(ErrorKind::DataError,
                         "Attempted to seek before start of file window (" + std::to_string(offset) + ")");
    }

    position_ = static_cast<std::uint64_t>(target);
    return Ok();
}

Result<void> WindowedReader::write(const std::vector<std::uint8_t>&) {
    return Err<void>(ErrorKind::Unsupported, "Windowed reader does not support writing");
}

} // namespace gcli::transfer
