#pragma once

// JSON helpers for request bodies, backed by json-c.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace execd::json_util {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
    bool is_object() const { return root && json_object_is_type(root, json_type_object); }
};

inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

inline json_object* member(const Doc& d, const char* key) {
    if (!d.is_object()) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(d.root, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(const Doc& d, const char* key) {
    json_object* v = member(d, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<bool> get_bool(const Doc& d, const char* key) {
    json_object* v = member(d, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline std::optional<int64_t> get_int(const Doc& d, const char* key) {
    json_object* v = member(d, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// {"K":"V",...} -> {"K=V",...}. Non-string values are skipped; nullopt if
// key is present but not an object.
inline std::optional<std::vector<std::string>> get_env_entries(const Doc& d, const char* key) {
    std::vector<std::string> out;
    json_object* v = member(d, key);
    if (!v || json_object_is_type(v, json_type_null)) return out;
    if (!json_object_is_type(v, json_type_object)) return std::nullopt;
    json_object_object_foreach(v, k, val) {
        if (!json_object_is_type(val, json_type_string)) continue;
        out.emplace_back(std::string(k) + "=" + json_object_get_string(val));
    }
    return out;
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

// Serializes and releases obj.
inline std::string to_string_and_put(json_object* obj) {
    std::string out = json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
    json_object_put(obj);
    return out;
}

} // namespace execd::json_util
