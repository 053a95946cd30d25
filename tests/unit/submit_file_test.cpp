/**
 * @file submit_file_test.cpp
 * @brief Deduplicating submission
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "test_support.hpp"
#include <thread>
#include <vector>

using namespace testsupport;
using filestore::application::exception::FileStoreException;

namespace {

FileStoreException submitExpectingFailure(SubmitFileUseCase& useCase, const SubmitFileCommand& command) {
    try {
        useCase.execute(command);
    } catch (const FileStoreException& e) {
        return e;
    }
    FAIL("expected FileStoreException");
    throw std::logic_error("unreachable");
}

} // namespace

TEST_CASE("First submission stores the content", "[submit]") {
    StoreFixture store;
    auto result = store.submit("hello", "a.txt");

    REQUIRE(result.type == SubmitOutcome::ORIGINAL);
    REQUIRE(result.message == "File uploaded successfully");
    REQUIRE_FALSE(result.reference.has_value());
    REQUIRE(result.file.originalFilename == "a.txt");
    REQUIRE(result.file.fileType == "text/plain");
    REQUIRE(result.file.size == 5);
    REQUIRE(result.file.contentHash == std::optional<std::string>(HELLO_SHA256));
    REQUIRE(result.file.referenceCount == 1);
    REQUIRE(result.file.storageSaved == 0);
    REQUIRE(store.blobs->exists(result.file.blobKey));
}

TEST_CASE("Identical content under another name becomes a reference", "[submit]") {
    StoreFixture store;
    auto first = store.submit("hello", "a.txt");
    auto second = store.submit("hello", "b.txt");

    REQUIRE(second.type == SubmitOutcome::REFERENCE);
    REQUIRE(second.message == "File content already exists as a.txt. Created a reference instead.");
    REQUIRE(second.reference.has_value());
    REQUIRE(second.reference->referenceName == "b.txt");
    REQUIRE(second.reference->originalFileId == first.file.id);
    REQUIRE(second.file.id == first.file.id);
    REQUIRE(second.file.referenceCount == 2);
    REQUIRE(second.file.storageSaved == 5);

    // Only one blob for the shared content
    REQUIRE(store.blobs->count() == 1);

    auto stats = store.repository->getStatistics();
    REQUIRE(stats.totalFiles == 1);
    REQUIRE(stats.totalReferences == 1);
    REQUIRE(stats.storageSaved == 5);
}

TEST_CASE("Resubmitting under the same reference name is a conflict", "[submit]") {
    StoreFixture store;
    store.submit("hello", "a.txt");
    store.submit("hello", "b.txt");

    SubmitFileUseCase useCase(store.repository, store.blobs);
    std::istringstream content("hello");
    auto error = submitExpectingFailure(useCase, SubmitFileCommand(content, "b.txt"));

    REQUIRE(error.getKind() == StoreErrorKind::DUPLICATE_NAME_CONFLICT);
    REQUIRE(error.getExistingName() == std::optional<std::string>("a.txt"));

    auto owner = store.repository->findFiles(FileQuery{}).content.at(0);
    REQUIRE(owner.getReferenceCount() == 2);
    REQUIRE(store.repository->getStatistics().totalReferences == 1);
}

TEST_CASE("Resubmitting content under the original's own name creates a reference", "[submit]") {
    StoreFixture store;
    store.submit("hello", "a.txt");
    auto again = store.submit("hello", "a.txt");

    REQUIRE(again.type == SubmitOutcome::REFERENCE);
    REQUIRE(again.file.referenceCount == 2);
}

TEST_CASE("Different content with the same name is stored separately", "[submit]") {
    StoreFixture store;
    auto first = store.submit("hello", "a.txt");
    auto second = store.submit("world", "a.txt");

    REQUIRE(second.type == SubmitOutcome::ORIGINAL);
    REQUIRE(second.file.id != first.file.id);
    REQUIRE(store.blobs->count() == 2);
}

TEST_CASE("Invalid submissions are validation errors", "[submit][validation]") {
    StoreFixture store;
    SubmitFileUseCase useCase(store.repository, store.blobs);

    SECTION("no content") {
        SubmitFileCommand command;
        command.filename = "a.txt";
        auto error = submitExpectingFailure(useCase, command);
        REQUIRE(error.getKind() == StoreErrorKind::VALIDATION_ERROR);
        REQUIRE(error.getMessage() == "No file provided");
    }

    SECTION("empty content") {
        std::istringstream content("");
        auto error = submitExpectingFailure(useCase, SubmitFileCommand(content, "a.txt"));
        REQUIRE(error.getKind() == StoreErrorKind::VALIDATION_ERROR);
    }

    SECTION("bad filename") {
        std::istringstream content("hello");
        auto error = submitExpectingFailure(useCase, SubmitFileCommand(content, "a/b.txt"));
        REQUIRE(error.getKind() == StoreErrorKind::VALIDATION_ERROR);
        REQUIRE(error.getDetail() == "INVALID_FILE_NAME");
    }

    SECTION("declared size mismatch") {
        std::istringstream content("hello");
        auto error = submitExpectingFailure(useCase, SubmitFileCommand(content, "a.txt", "", 6));
        REQUIRE(error.getKind() == StoreErrorKind::VALIDATION_ERROR);
    }

    SECTION("content type too long") {
        std::istringstream content("hello");
        auto error = submitExpectingFailure(useCase,
            SubmitFileCommand(content, "a.txt", std::string(SubmitFileUseCase::MAX_CONTENT_TYPE_LENGTH + 1, 't')));
        REQUIRE(error.getKind() == StoreErrorKind::VALIDATION_ERROR);
    }

    REQUIRE(store.repository->getStatistics().totalFiles == 0);
    REQUIRE(store.blobs->count() == 0);
}

TEST_CASE("Submission leaves the caller's stream position alone", "[submit]") {
    StoreFixture store;
    SubmitFileUseCase useCase(store.repository, store.blobs);

    std::istringstream content("hello");
    content.seekg(1);
    useCase.execute(SubmitFileCommand(content, "a.txt"));

    REQUIRE(content.tellg() == std::streampos(1));
}

TEST_CASE("Losing the creation race falls back to a reference", "[submit][race]") {
    StoreFixture store;
    auto first = store.submit("hello", "a.txt");

    // The digest lookup misses once, as if the first submission had not committed yet
    auto blind = std::make_shared<HashBlindRepository>(store.repository, 1);
    SubmitFileUseCase useCase(blind, store.blobs);

    std::istringstream content("hello");
    auto result = useCase.execute(SubmitFileCommand(content, "b.txt"));

    REQUIRE(result.type == SubmitOutcome::REFERENCE);
    REQUIRE(result.file.id == first.file.id);
    REQUIRE(result.file.referenceCount == 2);

    // The blob written for the losing create was released
    REQUIRE(store.blobs->count() == 1);
    REQUIRE(store.repository->getStatistics().totalFiles == 1);
}

TEST_CASE("Submission gives up after the configured number of rounds", "[submit][race]") {
    StoreFixture store;
    store.submit("hello", "a.txt");

    auto blind = std::make_shared<HashBlindRepository>(store.repository, 100);
    SubmitFileUseCase useCase(blind, store.blobs, ContentHasher(), 2);

    std::istringstream content("hello");
    auto error = submitExpectingFailure(useCase, SubmitFileCommand(content, "b.txt"));

    REQUIRE(error.getKind() == StoreErrorKind::STORAGE_FAILURE);
    REQUIRE(store.blobs->count() == 1);
    REQUIRE(store.repository->getStatistics().totalReferences == 0);
}

TEST_CASE("Owner deleted after the digest lookup is re-resolved as a new original", "[submit][race]") {
    StoreFixture store;
    auto first = store.submit("hello", "a.txt");
    auto vanished = store.fileById(first.file.id);
    DeleteFileUseCase(store.repository, store.blobs).execute(first.file.id);

    // false: the row lock sees the deletion; true: only the reference insert does
    const bool staleLock = GENERATE(false, true);
    INFO("stale row lock: " << staleLock);

    auto repository = std::make_shared<VanishedOwnerRepository>(store.repository, vanished, staleLock);
    SubmitFileUseCase useCase(repository, store.blobs);

    std::istringstream content("hello");
    auto result = useCase.execute(SubmitFileCommand(content, "b.txt"));

    REQUIRE(result.type == SubmitOutcome::ORIGINAL);
    REQUIRE(result.file.id != first.file.id);
    REQUIRE(result.file.originalFilename == "b.txt");
    REQUIRE(result.file.referenceCount == 1);
    REQUIRE_FALSE(result.reference.has_value());

    auto stats = store.repository->getStatistics();
    REQUIRE(stats.totalFiles == 1);
    REQUIRE(stats.totalReferences == 0);
    REQUIRE(store.blobs->count() == 1);
}

TEST_CASE("Parallel identical submissions store the content once", "[submit][concurrency]") {
    StoreFixture store;
    constexpr int THREADS = 8;

    std::vector<std::optional<SubmitResponse>> results(THREADS);
    std::vector<std::string> errors(THREADS);
    std::vector<std::thread> workers;
    for (int i = 0; i < THREADS; ++i) {
        workers.emplace_back([&store, &results, &errors, i]() {
            try {
                results[i] = store.submit("same content", "copy-" + std::to_string(i) + ".txt");
            } catch (const std::exception& e) {
                errors[i] = e.what();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    int originals = 0;
    for (int i = 0; i < THREADS; ++i) {
        INFO("worker " << i << ": " << errors[i]);
        const auto& result = results[i];
        REQUIRE(result.has_value());
        if (result->type == SubmitOutcome::ORIGINAL) {
            ++originals;
        }
    }
    REQUIRE(originals == 1);

    auto stats = store.repository->getStatistics();
    REQUIRE(stats.totalFiles == 1);
    REQUIRE(stats.totalReferences == THREADS - 1);
    REQUIRE(stats.storageSaved == 12 * (THREADS - 1));
    REQUIRE(store.blobs->count() == 1);

    auto owner = store.repository->findFiles(FileQuery{}).content.at(0);
    REQUIRE(owner.getReferenceCount() == THREADS);
}

TEST_CASE("Use case rejects missing collaborators", "[submit]") {
    auto repository = std::make_shared<InMemoryFileStoreRepository>();
    REQUIRE_THROWS_AS(SubmitFileUseCase(repository, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(SubmitFileUseCase(repository, std::make_shared<InMemoryBlobStorageAdapter>(), ContentHasher(), 0),
                      std::invalid_argument);
}
