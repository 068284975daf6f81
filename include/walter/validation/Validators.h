//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Field-level structural validators for untyped JSON payloads
//==========================================================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "walter/JSONRPCTypes.h"
#include "walter/errors/Errors.h"

namespace walter {
namespace validation {

//------------------------------ Lookup helpers ------------------------------
inline const JSONValue* findField(const JSONValue::Object& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || !it->second) return nullptr;
    return it->second.get();
}

inline const char* describe(const JSONValue* v) {
    return v ? typeName(*v) : "missing";
}

//------------------------------ Required fields (throw DecodeError) ------------------------------
// Message shape: "<context>: expected <type> for '<field>', got <actual>"

inline const JSONValue::Object& requireObject(const JSONValue& v, const std::string& context) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) {
        throw errors::DecodeError(context + ": expected object, got " + typeName(v));
    }
    return std::get<JSONValue::Object>(v.value);
}

inline std::string requireString(const JSONValue::Object& obj, const char* field, const std::string& context) {
    const JSONValue* v = findField(obj, field);
    if (v == nullptr || !std::holds_alternative<std::string>(v->value)) {
        throw errors::DecodeError(context + ": expected string for '" + field + "', got " + describe(v));
    }
    return std::get<std::string>(v->value);
}

// Doubles are accepted only when integral and inside the int64_t range.
inline int64_t requireInteger(const JSONValue::Object& obj, const char* field, const std::string& context) {
    const JSONValue* v = findField(obj, field);
    if (v != nullptr) {
        if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
        if (std::holds_alternative<double>(v->value)) {
            const double d = std::get<double>(v->value);
            constexpr double kLow = -9223372036854775808.0;
            constexpr double kHigh = 9223372036854775808.0;
            if (std::trunc(d) == d && d >= kLow && d < kHigh) return static_cast<int64_t>(d);
        }
    }
    throw errors::DecodeError(context + ": expected integer for '" + field + "', got " + describe(v));
}

inline const JSONValue::Array& requireArray(const JSONValue::Object& obj, const char* field, const std::string& context) {
    const JSONValue* v = findField(obj, field);
    if (v == nullptr || !std::holds_alternative<JSONValue::Array>(v->value)) {
        throw errors::DecodeError(context + ": expected array for '" + field + "', got " + describe(v));
    }
    return std::get<JSONValue::Array>(v->value);
}

//------------------------------ Optional fields (wrong type reads as absent) ------------------------------
inline std::optional<std::string> optionalString(const JSONValue::Object& obj, const char* field) {
    const JSONValue* v = findField(obj, field);
    if (v == nullptr || !std::holds_alternative<std::string>(v->value)) return std::nullopt;
    return std::get<std::string>(v->value);
}

inline std::optional<double> optionalNumber(const JSONValue::Object& obj, const char* field) {
    const JSONValue* v = findField(obj, field);
    if (v == nullptr) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return static_cast<double>(std::get<int64_t>(v->value));
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    return std::nullopt;
}

//------------------------------ Arrays of records ------------------------------
// Applies decodeItem to each element; a null slot decodes as JSON null.
template <typename DecodeItem>
auto decodeArray(const JSONValue::Object& obj, const char* field, const std::string& context, DecodeItem decodeItem)
    -> std::vector<decltype(decodeItem(std::declval<const JSONValue&>()))> {
    const auto& arr = requireArray(obj, field, context);
    std::vector<decltype(decodeItem(std::declval<const JSONValue&>()))> out;
    out.reserve(arr.size());
    const JSONValue nullValue;
    for (const auto& item : arr) {
        out.push_back(decodeItem(item ? *item : nullValue));
    }
    return out;
}

} // namespace validation
} // namespace walter
