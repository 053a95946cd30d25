/**
 * @file query_helpers.cpp
 * @brief SQL helper utilities implementation
 */

#include "query_helpers.h"
#include <sstream>
#include <stdexcept>

namespace common::db {

namespace {

int64_t parseInt64(const std::string& str, int64_t defaultValue) {
    if (str.empty()) return defaultValue;
    try {
        size_t pos = 0;
        long long parsed = std::stoll(str, &pos);
        return pos == str.size() ? static_cast<int64_t>(parsed) : defaultValue;
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

int64_t toInt64(const Json::Value& v, int64_t defaultValue) {
    if (v.isNull()) return defaultValue;
    if (v.isInt64()) return v.asInt64();
    if (v.isUInt64()) return static_cast<int64_t>(v.asUInt64());
    if (v.isString()) return parseInt64(v.asString(), defaultValue);
    if (v.isDouble()) return static_cast<int64_t>(v.asDouble());
    return defaultValue;
}

} // namespace

// ============================================================================
// JSON Value Extraction
// ============================================================================

int getInt(const Json::Value& json, const std::string& field, int defaultValue) {
    if (!json.isMember(field) || json[field].isNull()) return defaultValue;
    const auto& v = json[field];
    if (v.isInt()) return v.asInt();
    if (v.isUInt()) return static_cast<int>(v.asUInt());
    if (v.isString()) return static_cast<int>(parseInt64(v.asString(), defaultValue));
    if (v.isDouble()) return static_cast<int>(v.asDouble());
    return defaultValue;
}

int64_t getInt64(const Json::Value& json, const std::string& field, int64_t defaultValue) {
    if (!json.isMember(field)) return defaultValue;
    return toInt64(json[field], defaultValue);
}

bool getBool(const Json::Value& json, const std::string& field, bool defaultValue) {
    if (!json.isMember(field) || json[field].isNull()) return defaultValue;
    const auto& v = json[field];
    if (v.isBool()) return v.asBool();
    if (v.isString()) {
        const auto& s = v.asString();
        return s == "1" || s == "true" || s == "TRUE" || s == "t" || s == "T";
    }
    if (v.isInt()) return v.asInt() != 0;
    if (v.isUInt()) return v.asUInt() != 0;
    return defaultValue;
}

std::string getString(const Json::Value& json, const std::string& field,
                      const std::string& defaultValue) {
    if (!json.isMember(field) || json[field].isNull()) return defaultValue;
    // asString() renders numbers and booleans too
    return json[field].asString();
}

int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue) {
    return toInt64(value, defaultValue);
}

// ============================================================================
// SQL Expression Generation
// ============================================================================

std::string paginationClause(int limit, int64_t offset) {
    std::ostringstream ss;
    ss << " LIMIT " << limit << " OFFSET " << offset;
    return ss.str();
}

std::string limitClause(int limit) {
    std::ostringstream ss;
    ss << " LIMIT " << limit;
    return ss.str();
}

std::string ilikeCond(const std::string& column, const std::string& paramPlaceholder) {
    return column + " ILIKE " + paramPlaceholder;
}

std::string escapeLike(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '%' || c == '_' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

} // namespace common::db
