#include "gcli/transfer/tree_hash.hpp"

#include <openssl/evp.h>

#include <algorithm>

namespace gcli::transfer {

Digest sha256(const std::uint8_t* data, std::size_t size) {
    Digest digest{};
    unsigned int length = 0;
    EVP_Digest(data, size, digest.data(), &length, EVP_sha256(), nullptr);
    return digest;
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        result += hex[(data[i] >> 4) & 0xF];
        result += hex[data[i] & 0xF];
    }
    return result;
}

void TreeHasher::update(const std::uint8_t* data, std::size_t size) {
    total_ += size;
    while (size > 0) {
        const std::size_t room = kTreeHashBlockSize - block_.size();
        const std::size_t take = std::min(room, size);
        block_.insert(block_.end(), data, data + take);
        data += take;
        size -= take;
        if (block_.size() == kTreeHashBlockSize) {
            flush_block();
        }
    }
}

void TreeHasher::flush_block() {
    leaves_.push_back(sha256(block_.data(), block_.size()));
    block_.clear();
}

std::string TreeHasher::finish() {
    if (!block_.empty() || leaves_.empty()) {
        flush_block();
    }

    std::vector<Digest> level = std::move(leaves_);
    while (level.size() > 1) {
        std::vector<Digest> next;
        next.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i + 1 < level.size(); i += 2) {
            std::array<std::uint8_t, 64> joined{};
            std::copy(level[i].begin(), level[i].end(), joined.begin());
            std::copy(level[i + 1].begin(), level[i + 1].end(), joined.begin() + 32);
            next.push_back(sha256(joined.data(), joined.size()));
        }
        if (level.size() % 2 == 1) {
            next.push_back(level.back());
        }
        level = std::move(next);
    }

    leaves_.clear();
    return to_hex(level.front().data(), level.front().size());
}

std::string tree_hash(const std::vector<std::uint8_t>& data) {
    TreeHasher hasher;
    hasher.update(data);
    return hasher.finish();
}

Result<std::string> tree_hash_stream(std::istream& stream) {
    TreeHasher hasher;
    std::vector<char> buffer(kTreeHashBlockSize);
    while (stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || stream.gcount() > 0) {
        hasher.update(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                      static_cast<std::size_t>(stream.gcount()));
    }
    if (stream.bad()) {
        return Err<std::string>(ErrorKind::DataError, "Failed to read stream while computing tree hash");
    }
    return Ok(hasher.finish());
}

} // namespace gcli::transfer
