// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "hv/json.hpp"

namespace turion::json_util {

/// Safely extract a string from a JSON field that may be null.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Safely extract an int from a JSON field that may be number, string, or null.
/// Printer firmware reports some counters as strings ("sequence_id", "mc_percent").
inline int safe_int(const nlohmann::json& j, const char* key, int def = 0) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<int>();
    }
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// 64-bit variant for error codes such as print_error (0x0300400C...)
inline int64_t safe_int64(const nlohmann::json& j, const char* key, int64_t def = 0) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<int64_t>();
    }
    if (v.is_string()) {
        try {
            return std::stoll(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// Safely extract a bool from a JSON field that may be bool, number, "true"/"false" or null.
inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_number()) {
        return v.get<double>() != 0.0;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s == "true") {
            return true;
        }
        if (s == "false") {
            return false;
        }
    }
    return def;
}

} // namespace turion::json_util
