/**
 * @file query_helpers.cpp
 * @brief Row extraction and parameter helpers implementation
 * @date 2026-02-17
 */

#include "query_helpers.h"
#include <stdexcept>

namespace common::db {

// ============================================================================
// JSON Value Extraction
// ============================================================================

int getInt(const Json::Value& json, const std::string& field, int defaultValue) {
    return static_cast<int>(getInt64(json, field, defaultValue));
}

int64_t getInt64(const Json::Value& json, const std::string& field, int64_t defaultValue) {
    auto value = getOptionalInt64(json, field);
    return value ? *value : defaultValue;
}

std::optional<int64_t> getOptionalInt64(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
    const auto& v = json[field];
    if (v.isInt64()) return static_cast<int64_t>(v.asInt64());
    if (v.isUInt64()) return static_cast<int64_t>(v.asUInt64());
    if (v.isString()) {
        const auto& s = v.asString();
        if (s.empty()) return std::nullopt;
        try {
            size_t pos = 0;
            long long parsed = std::stoll(s, &pos);
            if (pos != s.size()) return std::nullopt;
            return static_cast<int64_t>(parsed);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (v.isDouble()) return static_cast<int64_t>(v.asDouble());
    return std::nullopt;
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
    auto value = getOptionalString(json, field);
    return value ? *value : defaultValue;
}

std::optional<std::string> getOptionalString(const Json::Value& json, const std::string& field) {
    if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
    const auto& v = json[field];
    if (v.isString()) return v.asString();
    if (v.isBool()) return std::string(v.asBool() ? "true" : "false");
    if (v.isIntegral()) return std::to_string(v.asInt64());
    if (v.isDouble()) return std::to_string(v.asDouble());
    return std::nullopt;
}

int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue) {
    Json::Value wrapper;
    wrapper["v"] = value;
    return getInt64(wrapper, "v", defaultValue);
}

// ============================================================================
// Parameter Encoding
// ============================================================================

std::string optionalParam(const std::optional<std::string>& value) {
    return value ? *value : std::string();
}

std::string optionalParam(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : std::string();
}

std::string boolParam(bool value) {
    return value ? "true" : "false";
}

} // namespace common::db
