/**
 * @file list_files_test.cpp
 * @brief File listing, reference listing and statistics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "test_support.hpp"

using namespace testsupport;
using filestore::application::exception::FileStoreException;

namespace {

using namespace std::chrono;

std::string hashOf(int seed) {
    std::string hex = std::to_string(seed);
    return std::string(64 - hex.size(), 'a') + hex;
}

void seed(InMemoryFileStoreRepository& repository, const std::string& name, const std::string& type,
          int64_t size, sys_days day, int seedValue) {
    repository.importLegacyFile(StoredFile::reconstruct(
        FileId::generate(), day + hours{12}, "uploads/" + name, FileName::of(name), type,
        FileSize::ofBytes(size), ContentHash::of(hashOf(seedValue)), 1));
}

/**
 * @brief Five files over three days
 */
std::shared_ptr<InMemoryFileStoreRepository> seededRepository() {
    auto repository = std::make_shared<InMemoryFileStoreRepository>();
    seed(*repository, "report.pdf", "application/pdf", 2048, sys_days{2024y / 3 / 1}, 1);
    seed(*repository, "Notes.txt", "text/plain", 100, sys_days{2024y / 3 / 1}, 2);
    seed(*repository, "photo.JPG", "image/jpeg", 50000, sys_days{2024y / 3 / 2}, 3);
    seed(*repository, "annual-report.docx", "application/msword", 4096, sys_days{2024y / 3 / 3}, 4);
    seed(*repository, "readme.md", "text/markdown", 10, sys_days{2024y / 3 / 3}, 5);
    return repository;
}

std::vector<std::string> names(const FileListResponse& response) {
    std::vector<std::string> out;
    for (const auto& file : response.content) {
        out.push_back(file.originalFilename);
    }
    return out;
}

FileStoreException listExpectingFailure(ListFilesUseCase& useCase, const ListFilesCommand& command) {
    try {
        useCase.execute(command);
    } catch (const FileStoreException& e) {
        return e;
    }
    FAIL("expected FileStoreException");
    throw std::logic_error("unreachable");
}

} // namespace

TEST_CASE("Default listing is newest first", "[list]") {
    ListFilesUseCase useCase(seededRepository());
    auto response = useCase.execute(ListFilesCommand{});

    REQUIRE(response.totalElements == 5);
    REQUIRE(response.content.size() == 5);
    REQUIRE(response.content.front().uploadedAt.rfind("2024-03-03", 0) == 0);
    REQUIRE(response.content.back().uploadedAt.rfind("2024-03-01", 0) == 0);
}

TEST_CASE("Filename and search filters are case-insensitive substrings", "[list]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand byName;
    byName.filename = "REPORT";
    byName.ordering = "original_filename";
    REQUIRE(names(useCase.execute(byName)) == std::vector<std::string>{"annual-report.docx", "report.pdf"});

    ListFilesCommand bySearch;
    bySearch.search = "text/";
    bySearch.ordering = "original_filename";
    REQUIRE(names(useCase.execute(bySearch)) == std::vector<std::string>{"Notes.txt", "readme.md"});
}

TEST_CASE("File type filter is a case-insensitive exact match", "[list]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    command.fileType = "IMAGE/JPEG";
    REQUIRE(names(useCase.execute(command)) == std::vector<std::string>{"photo.JPG"});

    command.fileType = "image";
    REQUIRE(useCase.execute(command).content.empty());
}

TEST_CASE("Size bounds are inclusive", "[list]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    command.minSize = 100;
    command.maxSize = 4096;
    command.ordering = "size";
    REQUIRE(names(useCase.execute(command)) ==
            std::vector<std::string>{"Notes.txt", "report.pdf", "annual-report.docx"});
}

TEST_CASE("Date bounds cover whole calendar days", "[list]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    command.uploadedAfter = "2024-03-02";
    command.uploadedBefore = "2024-03-02";
    REQUIRE(names(useCase.execute(command)) == std::vector<std::string>{"photo.JPG"});

    command.uploadedBefore = "2024-03-03";
    REQUIRE(useCase.execute(command).totalElements == 3);

    // Empty strings mean "no bound"
    command.uploadedAfter = "";
    command.uploadedBefore = "";
    REQUIRE(useCase.execute(command).totalElements == 5);
}

TEST_CASE("Ordering by size in both directions", "[list]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    command.ordering = "-size";
    auto descending = names(useCase.execute(command));
    REQUIRE(descending.front() == "photo.JPG");
    REQUIRE(descending.back() == "readme.md");

    command.ordering = "size";
    auto ascending = names(useCase.execute(command));
    REQUIRE(ascending.front() == "readme.md");
}

TEST_CASE("Pagination", "[list]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    command.ordering = "original_filename";
    command.size = 2;

    auto first = useCase.execute(command);
    REQUIRE(first.content.size() == 2);
    REQUIRE(first.totalElements == 5);
    REQUIRE(first.totalPages == 3);
    REQUIRE(first.hasNext);
    REQUIRE_FALSE(first.hasPrevious);

    command.page = 2;
    auto last = useCase.execute(command);
    REQUIRE(last.content.size() == 1);
    REQUIRE_FALSE(last.hasNext);
    REQUIRE(last.hasPrevious);

    command.page = 9;
    REQUIRE(useCase.execute(command).content.empty());
}

TEST_CASE("Invalid listing parameters are validation errors", "[list][validation]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    SECTION("page size") { command.size = 0; }
    SECTION("page size too large") { command.size = ListFilesUseCase::MAX_PAGE_SIZE + 1; }
    SECTION("negative page") { command.page = -1; }
    SECTION("negative size filter") { command.minSize = -5; }
    SECTION("inverted size range") { command.minSize = 10; command.maxSize = 5; }
    SECTION("malformed date") { command.uploadedAfter = "03/01/2024"; }
    SECTION("impossible date") { command.uploadedBefore = "2024-02-30"; }
    SECTION("inverted date range") { command.uploadedAfter = "2024-03-05"; command.uploadedBefore = "2024-03-01"; }
    SECTION("unknown ordering") { command.ordering = "-blob_key"; }

    REQUIRE(listExpectingFailure(useCase, command).getKind() == StoreErrorKind::VALIDATION_ERROR);
}

TEST_CASE("Pages beyond the addressable offset are rejected", "[list][validation]") {
    ListFilesUseCase useCase(seededRepository());

    ListFilesCommand command;
    command.page = 30000000;
    command.size = 100;
    REQUIRE(listExpectingFailure(useCase, command).getKind() == StoreErrorKind::VALIDATION_ERROR);

    PageRequest far{30000000, 100};
    REQUIRE(far.getOffset() == 3000000000LL);

    // Largest page that still fits is simply empty
    command.size = 1;
    command.page = static_cast<int>(ListFilesUseCase::MAX_OFFSET);
    REQUIRE(useCase.execute(command).content.empty());
}

TEST_CASE("Listing reads the store every time", "[list]") {
    StoreFixture store;
    ListFilesUseCase useCase(store.repository);

    REQUIRE(useCase.execute(ListFilesCommand{}).totalElements == 0);
    store.submit("hello", "a.txt");
    REQUIRE(useCase.execute(ListFilesCommand{}).totalElements == 1);
}

TEST_CASE("References are listed newest first, optionally per file", "[list][references]") {
    StoreFixture store;
    ListReferencesUseCase useCase(store.repository);

    auto hello = store.submit("hello", "a.txt");
    store.submit("hello", "b.txt");
    auto world = store.submit("world", "w.txt");
    store.submit("world", "w2.txt");

    REQUIRE(useCase.execute().content.size() == 2);

    auto forHello = useCase.execute(hello.file.id);
    REQUIRE(forHello.content.size() == 1);
    REQUIRE(forHello.content[0].referenceName == "b.txt");
    REQUIRE(forHello.toJson()["count"] == 1);

    REQUIRE(useCase.execute(world.file.id).content[0].referenceName == "w2.txt");
}

TEST_CASE("Listing references of a missing file is NOT_FOUND", "[list][references]") {
    StoreFixture store;
    ListReferencesUseCase useCase(store.repository);

    try {
        useCase.execute(FileId::generate().toString());
        FAIL("expected FileStoreException");
    } catch (const FileStoreException& e) {
        REQUIRE(e.getKind() == StoreErrorKind::NOT_FOUND);
    }
}

TEST_CASE("Statistics report savings", "[list][statistics]") {
    StoreFixture store;
    GetStorageStatisticsUseCase useCase(store.repository);

    auto empty = useCase.execute();
    REQUIRE(empty.totalFiles == 0);
    REQUIRE(empty.savingsPercent == 0.0);

    store.submit("hello", "a.txt");
    store.submit("hello", "b.txt");
    store.submit("hello", "c.txt");
    store.submit("0123456789", "digits.txt");

    auto stats = useCase.execute();
    REQUIRE(stats.totalFiles == 2);
    REQUIRE(stats.totalReferences == 2);
    REQUIRE(stats.physicalBytes == 15);
    REQUIRE(stats.storageSaved == 10);
    REQUIRE(stats.logicalBytes == 25);
    REQUIRE(stats.savingsPercent == Catch::Approx(40.0));
    REQUIRE(stats.storageSavedFormatted == "10.00 B");
}
