#include "dawn/json_mini.h"

#include <algorithm>
#include <climits>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace dawn::json_mini {

static json_object* parse_impl(const std::string& json, bool* ok) {
    *ok = false;
    json_tokener* tok = json_tokener_new();
    if (!tok) return nullptr;
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = (size_t)tok->char_offset;
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return nullptr;
    }
    // reject trailing non-whitespace
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return nullptr;
        }
    }
    *ok = true;
    return obj;
}

Doc parse(const std::string& json) {
    bool ok = false;
    // a literal null parses successfully into nullptr and stays an empty Doc
    return Doc{parse_impl(json, &ok)};
}

bool is_valid(const std::string& json) {
    bool ok = false;
    json_object* obj = parse_impl(json, &ok);
    if (obj) json_object_put(obj);
    return ok;
}

Doc parse_file(const std::filesystem::path& path, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "cannot open: " + path.string();
        return Doc{};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    Doc d = parse(ss.str());
    if (!d && err) *err = "invalid JSON: " + path.string();
    return d;
}

bool is_object(json_object* o) {
    return o && json_object_is_type(o, json_type_object);
}

bool is_array(json_object* o) {
    return o && json_object_is_type(o, json_type_array);
}

json_object* get(json_object* o, const char* key) {
    if (!is_object(o)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

std::optional<double> get_number(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = get(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

std::vector<std::string> array_strings(json_object* arr) {
    std::vector<std::string> out;
    if (!is_array(arr)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

std::vector<std::string> get_array_strings(json_object* o, const char* key) {
    return array_strings(get(o, key));
}

void put(json_object* o, const char* key, json_object* v) {
    json_object_object_add(o, key, v);
}

void put_string(json_object* o, const char* key, const std::string& v) {
    json_object_object_add(o, key, json_object_new_string_len(v.c_str(), (int)v.size()));
}

void put_int(json_object* o, const char* key, int64_t v) {
    json_object_object_add(o, key, json_object_new_int64(v));
}

void put_double(json_object* o, const char* key, double v) {
    json_object_object_add(o, key, json_object_new_double(v));
}

void put_bool(json_object* o, const char* key, bool v) {
    json_object_object_add(o, key, json_object_new_boolean(v ? 1 : 0));
}

json_object* string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) {
        json_object_array_add(arr, json_object_new_string_len(s.c_str(), (int)s.size()));
    }
    return arr;
}

json_object* clone(json_object* o) {
    if (!o) return nullptr;
    json_object* dst = nullptr;
    if (json_object_deep_copy(o, &dst, nullptr) != 0) return nullptr;
    return dst;
}

void deep_merge(json_object* base, json_object* patch) {
    if (!is_object(base) || !is_object(patch)) return;
    json_object_object_foreach(patch, k, v) {
        json_object* existing = nullptr;
        if (is_object(v) && json_object_object_get_ex(base, k, &existing) && is_object(existing)) {
            deep_merge(existing, v);
        } else {
            json_object_object_add(base, k, clone(v));
        }
    }
}

// ---------- sorted serialization ----------

static void emit_indent(std::ostringstream& out, int indent, int depth) {
    out << "\n";
    for (int i = 0; i < indent * depth; i++) out << ' ';
}

static void serialize(json_object* obj, std::ostringstream& out, int indent, int depth) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        if (keys.empty()) { out << "{}"; break; }
        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            if (indent >= 0) emit_indent(out, indent, depth + 1);
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, kPlainFlags);
            json_object_put(ks);
            out << (indent >= 0 ? ": " : ":");
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            serialize(val, out, indent, depth + 1);
        }
        if (indent >= 0) emit_indent(out, indent, depth);
        out << "}";
        break;
    }
    case json_type_array: {
        const size_t len = json_object_array_length(obj);
        if (len == 0) { out << "[]"; break; }
        out << "[";
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            if (indent >= 0) emit_indent(out, indent, depth + 1);
            serialize(json_object_array_get_idx(obj, i), out, indent, depth + 1);
        }
        if (indent >= 0) emit_indent(out, indent, depth);
        out << "]";
        break;
    }
    default:
        // json-c output for primitives is already canonical.
        out << json_object_to_json_string_ext(obj, kPlainFlags);
        break;
    }
}

std::string serialize_sorted(json_object* o, int indent) {
    std::ostringstream out;
    serialize(o, out, indent, 0);
    return out.str();
}

std::string to_compact(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, kPlainFlags);
}

std::string json_escape(const std::string& s) {
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

} // namespace dawn::json_mini
