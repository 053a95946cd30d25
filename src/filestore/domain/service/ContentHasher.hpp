/**
 * @file ContentHasher.hpp
 * @brief Streaming SHA-256 content digest
 */

#pragma once

#include "../model/ContentHash.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>

namespace filestore::domain::service {

using filestore::domain::model::ContentHash;

/**
 * @brief Digest of a stream plus the number of bytes it covers
 */
struct ContentDigest {
    ContentHash hash;
    int64_t bytes;
};

/**
 * @brief Computes the content digest used as deduplication identity
 *
 * The digest always covers the whole stream: the hasher seeks to offset 0,
 * reads in fixed-size chunks and afterwards restores the caller's read
 * position and stream state, even when hashing fails. The same stream can
 * then be persisted unchanged.
 *
 * Stateless apart from the chunk size; safe to share between threads.
 */
class ContentHasher {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

    /**
     * @throws std::invalid_argument if chunkSize is 0
     */
    explicit ContentHasher(size_t chunkSize = DEFAULT_CHUNK_SIZE);

    /**
     * @throws shared::exception::InfrastructureException if the stream cannot
     *         be positioned or read, or the digest cannot be computed
     */
    ContentDigest digest(std::istream& stream) const;

    ContentHash hash(std::istream& stream) const {
        return digest(stream).hash;
    }

    [[nodiscard]] size_t getChunkSize() const noexcept {
        return chunkSize_;
    }

private:
    size_t chunkSize_;
};

} // namespace filestore::domain::service
