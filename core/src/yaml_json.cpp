#include "dawn/yaml_json.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace dawn {

static bool parse_int64(const std::string& s, int64_t* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    *out = (int64_t)v;
    return true;
}

static bool parse_double(const std::string& s, double* out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || !end || *end != '\0') return false;
    *out = v;
    return true;
}

static bool is_bool_word(const std::string& s, bool* v) {
    if (s == "true" || s == "True" || s == "TRUE") { *v = true; return true; }
    if (s == "false" || s == "False" || s == "FALSE") { *v = false; return true; }
    return false;
}

static bool is_null_word(const std::string& s) {
    return s == "~" || s == "null" || s == "Null" || s == "NULL";
}

// strtod also takes "inf"/"nan" and hex; those stay strings
static bool is_float_text(const std::string& s, double* v) {
    bool numeric_chars = std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
    });
    return numeric_chars && parse_double(s, v);
}

// True when a plain (unquoted) scalar with this text would not read back as a string.
static bool plain_scalar_is_typed(const std::string& s) {
    bool b = false;
    int64_t i = 0;
    double d = 0.0;
    return s.empty() || is_bool_word(s, &b) || is_null_word(s) || parse_int64(s, &i) || is_float_text(s, &d);
}

static json_object* scalar_to_json(const YAML::Node& node) {
    const std::string scalar = node.Scalar();
    // yaml-cpp tags quoted scalars with "!"
    if (node.Tag() == "!") {
        return json_object_new_string_len(scalar.c_str(), (int)scalar.size());
    }
    bool b = false;
    if (is_bool_word(scalar, &b)) return json_object_new_boolean(b ? 1 : 0);
    if (is_null_word(scalar)) return nullptr;

    int64_t as_int = 0;
    if (parse_int64(scalar, &as_int)) return json_object_new_int64(as_int);
    double as_double = 0.0;
    if (is_float_text(scalar, &as_double)) return json_object_new_double(as_double);

    return json_object_new_string_len(scalar.c_str(), (int)scalar.size());
}

json_object* yaml_to_json(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) return nullptr;

    if (node.IsScalar()) return scalar_to_json(node);

    if (node.IsSequence()) {
        json_object* arr = json_object_new_array();
        for (const auto& item : node) {
            json_object_array_add(arr, yaml_to_json(item));
        }
        return arr;
    }

    if (node.IsMap()) {
        json_object* obj = json_object_new_object();
        for (const auto& kv : node) {
            const std::string key = kv.first.as<std::string>();
            json_object_object_add(obj, key.c_str(), yaml_to_json(kv.second));
        }
        return obj;
    }
    return nullptr;
}

json_mini::Doc load_yaml_file(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("cannot open: " + path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("invalid YAML in " + path.string() + ": " + e.what());
    }
    return json_mini::Doc{yaml_to_json(root)};
}

// ---------- JSON -> YAML ----------

static void emit_json(YAML::Emitter& out, json_object* obj) {
    if (!obj) {
        out << YAML::Null;
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());
        out << YAML::BeginMap;
        for (const auto& k : keys) {
            out << YAML::Key << k << YAML::Value;
            emit_json(out, json_mini::get(obj, k.c_str()));
        }
        out << YAML::EndMap;
        break;
    }
    case json_type_array: {
        out << YAML::BeginSeq;
        const size_t n = json_object_array_length(obj);
        for (size_t i = 0; i < n; i++) emit_json(out, json_object_array_get_idx(obj, i));
        out << YAML::EndSeq;
        break;
    }
    case json_type_boolean:
        out << (json_object_get_boolean(obj) != 0);
        break;
    case json_type_int:
        out << (long long)json_object_get_int64(obj);
        break;
    case json_type_double:
        out << json_object_get_double(obj);
        break;
    case json_type_string: {
        const std::string s = json_object_get_string(obj);
        if (plain_scalar_is_typed(s)) out << YAML::DoubleQuoted << s;
        else out << s;
        break;
    }
    default:
        out << YAML::Null;
        break;
    }
}

std::string json_to_yaml(json_object* obj) {
    YAML::Emitter out;
    emit_json(out, obj);
    return std::string(out.c_str()) + "\n";
}

} // namespace dawn
