/**
 * @file query_helpers.cpp
 * @brief Row value extraction implementation
 */

#include "query_helpers.h"
#include <sstream>
#include <stdexcept>

namespace common::db {

long long scalarToInt64(const Json::Value& value, long long defaultValue) {
    if (value.isNull()) return defaultValue;
    if (value.isInt64()) return value.asInt64();
    if (value.isUInt64()) return static_cast<long long>(value.asUInt64());
    if (value.isString()) {
        const auto& str = value.asString();
        if (str.empty()) return defaultValue;
        try { return std::stoll(str); }
        catch (const std::logic_error&) { return defaultValue; }
    }
    if (value.isDouble()) return static_cast<long long>(value.asDouble());
    if (value.isBool()) return value.asBool() ? 1 : 0;
    return defaultValue;
}

long long getInt64(const Json::Value& row, const std::string& field, long long defaultValue) {
    if (!row.isObject() || !row.isMember(field)) return defaultValue;
    return scalarToInt64(row[field], defaultValue);
}

int getInt(const Json::Value& row, const std::string& field, int defaultValue) {
    return static_cast<int>(getInt64(row, field, defaultValue));
}

bool getBool(const Json::Value& row, const std::string& field, bool defaultValue) {
    if (!row.isObject() || !row.isMember(field) || row[field].isNull()) return defaultValue;
    const auto& v = row[field];
    if (v.isBool()) return v.asBool();
    if (v.isString()) {
        const auto& s = v.asString();
        return s == "1" || s == "true" || s == "TRUE" || s == "t" || s == "T";
    }
    if (v.isIntegral()) return v.asInt64() != 0;
    return defaultValue;
}

std::string getString(const Json::Value& row, const std::string& field) {
    if (!row.isObject() || !row.isMember(field) || row[field].isNull()) return "";
    const auto& v = row[field];
    if (v.isString()) return v.asString();
    if (v.isIntegral()) return std::to_string(v.asInt64());
    if (v.isBool()) return v.asBool() ? "true" : "false";
    return v.asString();
}

std::optional<long long> getOptionalInt64(const Json::Value& row, const std::string& field) {
    if (!row.isObject() || !row.isMember(field) || row[field].isNull()) return std::nullopt;
    return scalarToInt64(row[field]);
}

std::string toJsonText(const Json::Value& value) {
    if (value.isNull()) return "";
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

Json::Value parseJsonText(const Json::Value& row, const std::string& field) {
    std::string text = getString(row, field);
    if (text.empty()) return Json::nullValue;

    Json::CharReaderBuilder reader;
    std::istringstream stream(text);
    Json::Value parsed;
    std::string errs;
    if (!Json::parseFromStream(reader, stream, &parsed, &errs)) {
        return Json::nullValue;
    }
    return parsed;
}

std::string stringListToJsonText(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& v : values) array.append(v);
    return toJsonText(array);
}

std::vector<std::string> getStringList(const Json::Value& row, const std::string& field) {
    std::vector<std::string> result;
    Json::Value parsed = parseJsonText(row, field);
    if (!parsed.isArray()) return result;
    for (const auto& item : parsed) {
        if (item.isString()) result.push_back(item.asString());
    }
    return result;
}

} // namespace common::db
