/**
 * @file controller_test.cpp
 * @brief Status codes and JSON bodies produced by the controller
 */

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "filestore/infrastructure/controller/FileStoreController.hpp"

using namespace testsupport;
using filestore::infrastructure::controller::ApiResult;
using filestore::infrastructure::controller::FileStoreController;

namespace {

struct ControllerFixture {
    StoreFixture store;
    FileStoreController controller{store.repository, store.blobs};

    ApiResult upload(const std::string& content, const std::string& name) {
        std::istringstream stream(content);
        return controller.upload(stream, name, "text/plain");
    }
};

} // namespace

TEST_CASE("Upload returns 201 with the outcome type", "[controller]") {
    ControllerFixture fixture;

    auto created = fixture.upload("hello", "a.txt");
    REQUIRE(created.status == 201);
    REQUIRE(created.body["type"] == "original");
    REQUIRE(created.body["message"] == "File uploaded successfully");
    REQUIRE(created.body["file"]["referenceCount"] == 1);
    REQUIRE(created.body["file"]["contentHash"] == HELLO_SHA256);

    auto referenced = fixture.upload("hello", "b.txt");
    REQUIRE(referenced.status == 201);
    REQUIRE(referenced.body["type"] == "reference");
    REQUIRE(referenced.body["reference"]["referenceName"] == "b.txt");
    REQUIRE(referenced.body["file"]["storageSaved"] == 5);
}

TEST_CASE("Conflicts map to 409 with the existing entity", "[controller]") {
    ControllerFixture fixture;
    auto original = fixture.upload("hello", "a.txt");
    fixture.upload("hello", "b.txt");

    auto clash = fixture.upload("hello", "b.txt");
    REQUIRE(clash.status == 409);
    REQUIRE(clash.body["error"] == "DUPLICATE_NAME_CONFLICT");
    REQUIRE(clash.body["existingFile"] == "a.txt");

    auto refused = fixture.controller.deleteFile(original.body["file"]["id"].get<std::string>());
    REQUIRE(refused.status == 409);
    REQUIRE(refused.body["error"] == "REFERENCE_EXISTS_CONFLICT");
    REQUIRE(refused.body["referenceCount"] == 1);
    REQUIRE(refused.body["message"] == "This file has 1 references. Delete the references first.");
}

TEST_CASE("Validation and not-found statuses", "[controller]") {
    ControllerFixture fixture;

    auto empty = fixture.upload("", "a.txt");
    REQUIRE(empty.status == 400);
    REQUIRE(empty.body["error"] == "VALIDATION_ERROR");
    REQUIRE_FALSE(empty.body.contains("detail"));

    auto missing = fixture.controller.deleteFile(FileId::generate().toString());
    REQUIRE(missing.status == 404);
    REQUIRE(missing.body["error"] == "NOT_FOUND");

    ListFilesCommand badPage;
    badPage.size = 0;
    REQUIRE(fixture.controller.listFiles(badPage).status == 400);
}

TEST_CASE("Names that are not UTF-8 are rejected before anything is stored", "[controller][validation]") {
    ControllerFixture fixture;

    auto rejected = fixture.upload("hello", "\xff\xfe.txt");
    REQUIRE(rejected.status == 400);
    REQUIRE(rejected.body["error"] == "VALIDATION_ERROR");
    REQUIRE_NOTHROW(rejected.body.dump());

    auto listing = fixture.controller.listFiles(ListFilesCommand{});
    REQUIRE(listing.status == 200);
    REQUIRE(listing.body["totalElements"] == 0);
    REQUIRE(fixture.store.blobs->count() == 0);
}

TEST_CASE("Diagnostic detail only in debug mode", "[controller]") {
    StoreFixture store;
    FileStoreController quiet(store.repository, store.blobs);
    FileStoreController verbose(store.repository, store.blobs, ContentHasher(), 3, true);

    std::istringstream a("hello");
    REQUIRE_FALSE(quiet.upload(a, "bad/name").body.contains("detail"));

    std::istringstream b("hello");
    auto result = verbose.upload(b, "bad/name");
    REQUIRE(result.status == 400);
    REQUIRE(result.body["detail"] == "INVALID_FILE_NAME");
}

TEST_CASE("Delete, list and statistics success statuses", "[controller]") {
    ControllerFixture fixture;
    auto original = fixture.upload("hello", "a.txt");
    auto reference = fixture.upload("hello", "b.txt");
    const auto fileId = original.body["file"]["id"].get<std::string>();

    auto references = fixture.controller.listReferences(fileId);
    REQUIRE(references.status == 200);
    REQUIRE(references.body["count"] == 1);

    auto stats = fixture.controller.statistics();
    REQUIRE(stats.status == 200);
    REQUIRE(stats.body["storageSaved"] == 5);

    auto released = fixture.controller.deleteReference(reference.body["reference"]["id"].get<std::string>());
    REQUIRE(released.status == 200);
    REQUIRE(released.body["file"]["referenceCount"] == 1);

    auto deleted = fixture.controller.deleteFile(fileId);
    REQUIRE(deleted.status == 204);
    REQUIRE(deleted.body.is_null());

    auto listing = fixture.controller.listFiles(ListFilesCommand{});
    REQUIRE(listing.status == 200);
    REQUIRE(listing.body["totalElements"] == 0);

    auto backfill = fixture.controller.backfill();
    REQUIRE(backfill.status == 200);
    REQUIRE(backfill.body["scanned"] == 0);
}

TEST_CASE("Error kinds map to fixed statuses", "[controller]") {
    REQUIRE(FileStoreController::statusFor(StoreErrorKind::VALIDATION_ERROR) == 400);
    REQUIRE(FileStoreController::statusFor(StoreErrorKind::NOT_FOUND) == 404);
    REQUIRE(FileStoreController::statusFor(StoreErrorKind::DUPLICATE_NAME_CONFLICT) == 409);
    REQUIRE(FileStoreController::statusFor(StoreErrorKind::REFERENCE_EXISTS_CONFLICT) == 409);
    REQUIRE(FileStoreController::statusFor(StoreErrorKind::STORAGE_FAILURE) == 500);
}
