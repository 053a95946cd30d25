/**
 * @file ContentHasher.cpp
 * @brief Streaming SHA-256 content digest
 */

#include "ContentHasher.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace filestore::domain::service {

namespace {

/**
 * @brief Puts a stream back where it was found on scope exit
 */
class StreamPositionGuard {
public:
    explicit StreamPositionGuard(std::istream& stream)
        : stream_(stream), state_(stream.rdstate()) {
        stream_.clear();
        position_ = stream_.tellg();
    }

    ~StreamPositionGuard() {
        stream_.clear();
        if (position_ != std::streampos(-1)) {
            stream_.seekg(position_);
        }
        stream_.clear(state_);
    }

    StreamPositionGuard(const StreamPositionGuard&) = delete;
    StreamPositionGuard& operator=(const StreamPositionGuard&) = delete;

    [[nodiscard]] bool isSeekable() const noexcept {
        return position_ != std::streampos(-1);
    }

private:
    std::istream& stream_;
    std::ios::iostate state_;
    std::streampos position_;
};

[[noreturn]] void fail(const std::string& message) {
    throw shared::exception::InfrastructureException("HASH_ERROR", message);
}

} // namespace

ContentHasher::ContentHasher(size_t chunkSize)
    : chunkSize_(chunkSize)
{
    if (chunkSize_ == 0) {
        throw std::invalid_argument("ContentHasher: chunk size must be positive");
    }
}

ContentDigest ContentHasher::digest(std::istream& stream) const {
    StreamPositionGuard guard(stream);
    if (!guard.isSeekable()) {
        fail("Content stream is not seekable");
    }

    stream.seekg(0, std::ios::beg);
    if (!stream) {
        fail("Failed to rewind content stream");
    }

    // Use EVP API for OpenSSL 3.x compatibility
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), EVP_MD_CTX_free
    );
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        fail("Failed to initialise SHA-256 context");
    }

    std::vector<char> buffer(chunkSize_);
    int64_t total = 0;

    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = stream.gcount();
        if (got > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
                fail("Failed to update SHA-256 digest");
            }
            total += got;
        }
    }

    if (stream.bad()) {
        fail("I/O error while reading content stream");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &mdLength) != 1) {
        fail("Failed to finalise SHA-256 digest");
    }

    auto hash = ContentHash::fromDigest(md, mdLength);
    spdlog::debug("[ContentHasher] Hashed {} bytes: {}", total, hash.toString());
    return ContentDigest{std::move(hash), total};
}

} // namespace filestore::domain::service
