#pragma once

#include <cstdint>
#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief SQL helper utilities for PostgreSQL repositories
 *
 * Row field extraction with type-safe fallbacks and small SQL fragment
 * builders, so repository code does not repeat the same conversions.
 *
 * Usage:
 *   int64_t size = common::db::getInt64(row, "size");
 *   sql << common::db::paginationClause(limit, offset);
 */

namespace common::db {

// ============================================================================
// JSON Value Extraction
// ============================================================================

/**
 * @brief Extract integer from JSON row with type-safe conversion
 *
 * Handles int, uint, string, and double types.
 *
 * @param json JSON object containing the field
 * @param field Field name to extract
 * @param defaultValue Default value if field is missing, null, or unparseable
 */
int getInt(const Json::Value& json, const std::string& field, int defaultValue = 0);

/**
 * @brief Extract 64-bit integer (BIGINT columns: sizes, byte totals, epoch micros)
 */
int64_t getInt64(const Json::Value& json, const std::string& field, int64_t defaultValue = 0);

/**
 * @brief Extract boolean (PostgreSQL boolean or "t"/"f" text)
 */
bool getBool(const Json::Value& json, const std::string& field, bool defaultValue = false);

/**
 * @brief Extract string; null or missing yields the default
 */
std::string getString(const Json::Value& json, const std::string& field,
                      const std::string& defaultValue = "");

/**
 * @brief Convert a scalar JSON value (executeScalar result) to int64
 */
int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue = 0);

// ============================================================================
// SQL Expression Generation
// ============================================================================

/**
 * @brief Build pagination clause: " LIMIT 10 OFFSET 0"
 */
std::string paginationClause(int limit, int64_t offset);

/**
 * @brief Build simple row limit clause: " LIMIT 10"
 */
std::string limitClause(int limit);

/**
 * @brief Build case-insensitive search condition: "column ILIKE $3"
 */
std::string ilikeCond(const std::string& column, const std::string& paramPlaceholder);

/**
 * @brief Escape LIKE wildcards (%, _ and backslash) for a literal substring match
 */
std::string escapeLike(const std::string& value);

} // namespace common::db
