/**
 * @file in_memory_repository_test.cpp
 * @brief Constraint and transaction behaviour of the in-memory store
 */

#include <catch2/catch_test_macros.hpp>

#include "filestore/infrastructure/repository/InMemoryFileStoreRepository.hpp"
#include "shared/lib/exception/exceptions.h"

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using filestore::infrastructure::repository::InMemoryFileStoreRepository;

namespace {

const std::string HASH_A = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
const std::string HASH_B = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

StoredFile makeFile(const std::string& name, int64_t size, const std::string& hash) {
    return StoredFile::create(FileName::of(name), "text/plain", FileSize::ofBytes(size),
                              ContentHash::of(hash), "uploads/" + name);
}

StoredFile insertCommitted(InMemoryFileStoreRepository& repository, const StoredFile& file) {
    auto tx = repository.begin();
    tx->insertFile(file);
    tx->commit();
    return file;
}

} // namespace

TEST_CASE("Committed rows become visible", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto file = insertCommitted(repository, makeFile("a.txt", 5, HASH_A));

    REQUIRE(repository.findFileById(file.getId()).has_value());

    auto tx = repository.begin();
    auto found = tx->findFileByHash(ContentHash::of(HASH_A));
    REQUIRE(found.has_value());
    REQUIRE(found->getId() == file.getId());
    REQUIRE_FALSE(tx->findFileByHash(ContentHash::of(HASH_B)).has_value());
}

TEST_CASE("Rolled back and abandoned transactions leave no trace", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto file = makeFile("a.txt", 5, HASH_A);

    {
        auto tx = repository.begin();
        tx->insertFile(file);
        tx->rollback();
    }
    REQUIRE_FALSE(repository.findFileById(file.getId()).has_value());

    {
        auto tx = repository.begin();
        tx->insertFile(file);
        // destroyed without commit
    }
    REQUIRE_FALSE(repository.findFileById(file.getId()).has_value());
    REQUIRE(repository.getStatistics().totalFiles == 0);
}

TEST_CASE("Content hash is unique across stored files", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    insertCommitted(repository, makeFile("a.txt", 5, HASH_A));

    auto tx = repository.begin();
    try {
        tx->insertFile(makeFile("other.txt", 5, HASH_A));
        FAIL("expected unique violation");
    } catch (const common::UniqueViolationException& e) {
        REQUIRE(e.getConstraint() == constraint::CONTENT_HASH_UNIQUE);
        REQUIRE(e.getSqlState() == "23505");
    }

    // A failed statement poisons the transaction until it ends
    REQUIRE_THROWS_AS(tx->findFileByHash(ContentHash::of(HASH_A)), common::DatabaseException);
    tx->rollback();

    REQUIRE(repository.getStatistics().totalFiles == 1);
}

TEST_CASE("Stored file names need not be unique", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    insertCommitted(repository, makeFile("same.txt", 5, HASH_A));
    REQUIRE_NOTHROW(insertCommitted(repository, makeFile("same.txt", 3, HASH_B)));
    REQUIRE(repository.getStatistics().totalFiles == 2);
}

TEST_CASE("References require an existing owner and a unique name", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto owner = insertCommitted(repository, makeFile("a.txt", 5, HASH_A));

    {
        auto tx = repository.begin();
        REQUIRE_THROWS_AS(tx->insertReference(FileReference::create(FileId::generate(), FileName::of("x.txt"))),
                          common::ForeignKeyViolationException);
    }

    {
        auto tx = repository.begin();
        tx->insertReference(FileReference::create(owner.getId(), FileName::of("b.txt")));
        tx->commit();
    }

    auto tx = repository.begin();
    try {
        tx->insertReference(FileReference::create(owner.getId(), FileName::of("b.txt")));
        FAIL("expected unique violation");
    } catch (const common::UniqueViolationException& e) {
        REQUIRE(e.getConstraint() == constraint::REFERENCE_NAME_UNIQUE);
    }
}

TEST_CASE("A file with references cannot be deleted", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto owner = insertCommitted(repository, makeFile("a.txt", 5, HASH_A));
    auto reference = FileReference::create(owner.getId(), FileName::of("b.txt"));

    {
        auto tx = repository.begin();
        tx->insertReference(reference);
        tx->commit();
    }

    {
        auto tx = repository.begin();
        REQUIRE(tx->countReferences(owner.getId()) == 1);
        REQUIRE_THROWS_AS(tx->deleteFile(owner.getId()), common::ForeignKeyViolationException);
    }

    auto tx = repository.begin();
    REQUIRE(tx->deleteReference(reference.getId()));
    REQUIRE(tx->deleteFile(owner.getId()));
    tx->commit();
    REQUIRE_FALSE(repository.findFileById(owner.getId()).has_value());
}

TEST_CASE("adjustReferenceCount keeps storage saved in step", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto owner = insertCommitted(repository, makeFile("a.txt", 5, HASH_A));

    auto tx = repository.begin();
    auto bumped = tx->adjustReferenceCount(owner.getId(), +1);
    REQUIRE(bumped.has_value());
    REQUIRE(bumped->getReferenceCount() == 2);
    REQUIRE(bumped->getStorageSaved() == 5);

    auto floored = tx->adjustReferenceCount(owner.getId(), -1);
    floored = tx->adjustReferenceCount(owner.getId(), -1);
    REQUIRE(floored->getReferenceCount() == 1);
    REQUIRE(floored->getStorageSaved() == 0);

    REQUIRE_FALSE(tx->adjustReferenceCount(FileId::generate(), +1).has_value());
}

TEST_CASE("setContentHash only fills empty hashes", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto legacy = StoredFile::reconstruct(FileId::generate(), std::chrono::system_clock::now(),
                                          "uploads/legacy.bin", FileName::of("legacy.bin"), "",
                                          FileSize::ofBytes(5), std::nullopt, 1);
    repository.importLegacyFile(legacy);
    insertCommitted(repository, makeFile("a.txt", 3, HASH_B));

    REQUIRE(repository.findFilesMissingHash(10).size() == 1);

    {
        auto tx = repository.begin();
        REQUIRE_THROWS_AS(tx->setContentHash(legacy.getId(), ContentHash::of(HASH_B)),
                          common::UniqueViolationException);
    }

    auto tx = repository.begin();
    REQUIRE(tx->setContentHash(legacy.getId(), ContentHash::of(HASH_A)));
    REQUIRE_FALSE(tx->setContentHash(legacy.getId(), ContentHash::of(HASH_A)));
    tx->commit();

    REQUIRE(repository.findFilesMissingHash(10).empty());
}

TEST_CASE("Statistics aggregate files and references", "[repository][memory]") {
    InMemoryFileStoreRepository repository;
    auto owner = insertCommitted(repository, makeFile("a.txt", 5, HASH_A));
    insertCommitted(repository, makeFile("c.txt", 3, HASH_B));

    auto tx = repository.begin();
    tx->insertReference(FileReference::create(owner.getId(), FileName::of("b.txt")));
    tx->adjustReferenceCount(owner.getId(), +1);
    tx->commit();

    auto stats = repository.getStatistics();
    REQUIRE(stats.totalFiles == 2);
    REQUIRE(stats.totalReferences == 1);
    REQUIRE(stats.physicalBytes == 8);
    REQUIRE(stats.storageSaved == 5);
    REQUIRE(stats.logicalBytes() == 13);
}
