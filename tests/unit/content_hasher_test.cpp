/**
 * @file content_hasher_test.cpp
 * @brief Streaming SHA-256 digest
 */

#include <catch2/catch_test_macros.hpp>

#include "filestore/domain/service/ContentHasher.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include <sstream>
#include <streambuf>

using filestore::domain::service::ContentHasher;
using shared::exception::InfrastructureException;

namespace {

/**
 * @brief Read-only buffer that refuses to seek
 */
class ForwardOnlyBuffer : public std::streambuf {
public:
    explicit ForwardOnlyBuffer(std::string data) : data_(std::move(data)) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

private:
    std::string data_;
};

} // namespace

TEST_CASE("Known SHA-256 vectors", "[hasher]") {
    ContentHasher hasher;

    std::istringstream hello("hello");
    auto digest = hasher.digest(hello);
    REQUIRE(digest.hash.toString() == "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    REQUIRE(digest.bytes == 5);

    std::istringstream empty("");
    auto emptyDigest = hasher.digest(empty);
    REQUIRE(emptyDigest.hash.toString() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(emptyDigest.bytes == 0);
}

TEST_CASE("Digest does not depend on chunk size", "[hasher]") {
    std::string content;
    for (int i = 0; i < 10000; ++i) {
        content += static_cast<char>(i % 251);
    }

    std::istringstream a(content);
    std::istringstream b(content);
    std::istringstream c(content);

    auto reference = ContentHasher(4096).digest(a);
    REQUIRE(ContentHasher(1).digest(b).hash == reference.hash);
    REQUIRE(ContentHasher(7).digest(c).hash == reference.hash);
    REQUIRE(reference.bytes == 10000);
}

TEST_CASE("Hasher reads from the start and restores the stream position", "[hasher]") {
    ContentHasher hasher;
    std::istringstream stream("hello");
    stream.seekg(3);

    auto hash = hasher.hash(stream);

    REQUIRE(hash.toString() == "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    REQUIRE(stream.tellg() == std::streampos(3));
    REQUIRE(stream.good());

    char next = 0;
    stream.get(next);
    REQUIRE(next == 'l');
}

TEST_CASE("Hashing twice yields the same digest", "[hasher]") {
    ContentHasher hasher;
    std::istringstream stream("same bytes");
    REQUIRE(hasher.hash(stream) == hasher.hash(stream));
}

TEST_CASE("Unseekable streams are rejected", "[hasher]") {
    ForwardOnlyBuffer buffer("data");
    std::istream stream(&buffer);

    REQUIRE_THROWS_AS(ContentHasher().digest(stream), InfrastructureException);
}

TEST_CASE("Chunk size must be positive", "[hasher]") {
    REQUIRE_THROWS_AS(ContentHasher(0), std::invalid_argument);
    REQUIRE(ContentHasher(8192).getChunkSize() == 8192);
}
