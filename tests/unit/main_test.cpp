/**
 * @file main_test.cpp
 * @brief Shared kernel tests
 */

#include <catch2/catch_test_macros.hpp>

// Shared kernel tests
#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/exception/ApplicationException.hpp"
#include "shared/util/UuidUtil.hpp"

using namespace shared::domain;
using namespace shared::exception;

// =============================================================================
// Value Object Tests
// =============================================================================

class TestStringValue : public StringValueObject {
public:
    static TestStringValue of(const std::string& value) {
        return TestStringValue(value);
    }

private:
    explicit TestStringValue(std::string value)
        : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const {
        if (value_.empty()) {
            throw DomainException("INVALID_VALUE", "Value cannot be empty");
        }
    }
};

TEST_CASE("StringValueObject equality", "[domain][valueobject]") {
    auto vo1 = TestStringValue::of("test");
    auto vo2 = TestStringValue::of("test");
    auto vo3 = TestStringValue::of("other");

    REQUIRE(vo1 == vo2);
    REQUIRE(vo1 != vo3);
}

TEST_CASE("StringValueObject getValue", "[domain][valueobject]") {
    auto vo = TestStringValue::of("hello");
    REQUIRE(vo.getValue() == "hello");
}

TEST_CASE("StringValueObject isEmpty", "[domain][valueobject]") {
    auto vo = TestStringValue::of("hello");
    REQUIRE_FALSE(vo.isEmpty());
}

TEST_CASE("StringValueObject validation throws", "[domain][valueobject]") {
    REQUIRE_THROWS_AS(TestStringValue::of(""), DomainException);
}

// =============================================================================
// Domain Exception Tests
// =============================================================================

TEST_CASE("DomainException code and message", "[exception]") {
    DomainException ex("TEST_CODE", "Test message");

    REQUIRE(ex.getCode() == "TEST_CODE");
    REQUIRE(ex.getMessage() == "Test message");
    REQUIRE(std::string(ex.what()) == "Test message");
}

TEST_CASE("DomainException can be caught as std::exception", "[exception]") {
    bool caught = false;

    try {
        throw DomainException("CODE", "Message");
    } catch (const std::exception& e) {
        caught = true;
        REQUIRE(std::string(e.what()) == "Message");
    }

    REQUIRE(caught);
}

TEST_CASE("Exception layers share the coded base", "[exception]") {
    InfrastructureException infra("STORAGE_ERROR", "disk full");
    ApplicationException app("NOT_FOUND", "missing");

    const CodedException& asCoded = infra;
    REQUIRE(asCoded.getCode() == "STORAGE_ERROR");
    REQUIRE(app.getCode() == "NOT_FOUND");
    REQUIRE(std::string(app.what()) == "missing");
}

// =============================================================================
// UUID Tests
// =============================================================================

using shared::util::UuidUtil;

TEST_CASE("UuidUtil generates distinct v4 identifiers", "[util][uuid]") {
    auto first = UuidUtil::generate();
    auto second = UuidUtil::generate();

    REQUIRE(first.length() == 36);
    REQUIRE(UuidUtil::isValidV4(first));
    REQUIRE(UuidUtil::isValidV4(second));
    REQUIRE(first != second);
}

TEST_CASE("UuidUtil validation and normalization", "[util][uuid]") {
    REQUIRE(UuidUtil::isValidV4("3f2b8c1e-9d4a-4b7e-8a61-0c5d2e7f9a13"));
    REQUIRE(UuidUtil::isValidV4("3F2B8C1E-9D4A-4B7E-8A61-0C5D2E7F9A13"));
    REQUIRE_FALSE(UuidUtil::isValidV4("3f2b8c1e-9d4a-1b7e-8a61-0c5d2e7f9a13"));   // version 1
    REQUIRE_FALSE(UuidUtil::isValidV4("3f2b8c1e9d4a4b7e8a610c5d2e7f9a13"));
    REQUIRE_FALSE(UuidUtil::isValidV4(""));

    REQUIRE(UuidUtil::normalize("3F2B8C1E-9D4A-4B7E-8A61-0C5D2E7F9A13") ==
            "3f2b8c1e-9d4a-4b7e-8a61-0c5d2e7f9a13");
}
