#pragma once

// json_mini.h
//
// Small helper layer over json-c: an owning Doc handle, typed getters on
// json_object*, canonical (sorted-key) serialization and deep merge.

#include <json-c/json.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dawn::json_mini {

// Compact output without the json-c "\/" escape.
constexpr int kPlainFlags = JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE;

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

    // Hands ownership to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or a syntax error yields an empty Doc.
Doc parse(const std::string& json);
Doc parse_file(const std::filesystem::path& path, std::string* err = nullptr);
// True for any well-formed JSON text, including a bare null.
bool is_valid(const std::string& json);

inline Doc new_object() { return Doc{json_object_new_object()}; }
inline Doc new_array() { return Doc{json_object_new_array()}; }

bool is_object(json_object* o);
bool is_array(json_object* o);

// Borrowed child, or nullptr when o is not an object or key is absent.
json_object* get(json_object* o, const char* key);

std::optional<std::string> get_string(json_object* o, const char* key);
std::optional<int64_t> get_int(json_object* o, const char* key);
// Accepts both integer and double values.
std::optional<double> get_number(json_object* o, const char* key);
std::optional<bool> get_bool(json_object* o, const char* key);
std::vector<std::string> get_array_strings(json_object* o, const char* key);
std::vector<std::string> array_strings(json_object* arr);

// Takes ownership of v.
void put(json_object* o, const char* key, json_object* v);
void put_string(json_object* o, const char* key, const std::string& v);
void put_int(json_object* o, const char* key, int64_t v);
void put_double(json_object* o, const char* key, double v);
void put_bool(json_object* o, const char* key, bool v);
json_object* string_array(const std::vector<std::string>& items);

// Returns a new reference (caller owns). nullptr in, nullptr out.
json_object* clone(json_object* o);

// Recursively merges patch into base. Nested objects merge, anything else
// from patch replaces the value in base.
void deep_merge(json_object* base, json_object* patch);

// Sorted-key serialization. indent < 0 emits the compact canonical form used
// for digests and ledger lines; indent >= 0 pretty-prints with that many spaces.
std::string serialize_sorted(json_object* o, int indent = -1);
inline std::string canonical(json_object* o) { return serialize_sorted(o, -1); }

std::string to_compact(json_object* o);

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
std::string json_escape(const std::string& s);

} // namespace dawn::json_mini
