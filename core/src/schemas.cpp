#include "dawn/schemas.h"

#include <map>

namespace dawn::schemas {

namespace {

using T = Type;

const ObjectRule kNode{{
    {"name", T::STRING, true},
    {"role", T::STRING, true},
    {"node_type", T::STRING, true},
    {"architecture", T::STRING, false},
    {"operating_system", T::STRING, false},
    {"template_hint", T::STRING, false},
    {"parent_group", T::STRING_OR_NULL, false},
    {"interfaces", T::ARRAY, false},
    {"services", T::ARRAY, false},
    {"metadata", T::OBJECT, false},
}};

const ObjectRule kConnection{{
    {"source_node", T::STRING, true},
    {"target_node", T::STRING, true},
    {"connection_type", T::STRING, false},
    {"bidirectional", T::BOOLEAN, false},
    {"confidence", T::NUMBER, false},
}};

const ObjectRule kGroup{{
    {"name", T::STRING, true},
    {"member_nodes", T::ARRAY, true, nullptr, T::STRING},
    {"parent_group", T::STRING_OR_NULL, false},
    {"group_type", T::STRING, false},
}};

const ObjectRule kProjectIr{{
    {"name", T::STRING, true},
    {"description", T::STRING, false},
    {"nodes", T::ARRAY, true, &kNode},
    {"connections", T::ARRAY, true, &kConnection},
    {"groups", T::ARRAY, true, &kGroup},
    {"workflow", T::OBJECT, false},
    {"metadata", T::OBJECT, false},
}};

const std::map<std::string, const ObjectRule*>& registry() {
    static const std::map<std::string, const ObjectRule*> r = {
        {"dawn.project.ir", &kProjectIr},
    };
    return r;
}

const char* type_name(Type t) {
    switch (t) {
        case T::ANY: return "any";
        case T::STRING: return "string";
        case T::NUMBER: return "number";
        case T::BOOLEAN: return "boolean";
        case T::OBJECT: return "object";
        case T::ARRAY: return "array";
        case T::STRING_OR_NULL: return "string or null";
    }
    return "any";
}

bool matches(json_object* v, Type t) {
    switch (t) {
        case T::ANY: return true;
        case T::STRING: return v && json_object_is_type(v, json_type_string);
        case T::NUMBER: return v && (json_object_is_type(v, json_type_int) || json_object_is_type(v, json_type_double));
        case T::BOOLEAN: return v && json_object_is_type(v, json_type_boolean);
        case T::OBJECT: return v && json_object_is_type(v, json_type_object);
        case T::ARRAY: return v && json_object_is_type(v, json_type_array);
        case T::STRING_OR_NULL: return !v || json_object_is_type(v, json_type_string);
    }
    return false;
}

std::string check_object(json_object* o, const ObjectRule& rule, const std::string& where) {
    std::string prefix = where.empty() ? "" : where + ".";
    if (!json_mini::is_object(o)) return (where.empty() ? "$" : where) + ": expected object";

    for (const auto& f : rule.fields) {
        json_object* v = nullptr;
        bool present = json_object_object_get_ex(o, f.key, &v);
        if (!present) {
            if (f.required) return prefix + f.key + ": required";
            continue;
        }
        if (!matches(v, f.type)) return prefix + f.key + ": expected " + type_name(f.type);
        if (f.type != T::ARRAY) continue;

        const size_t n = json_object_array_length(v);
        for (size_t i = 0; i < n; i++) {
            json_object* el = json_object_array_get_idx(v, i);
            std::string at = prefix + f.key + "[" + std::to_string(i) + "]";
            if (f.items) {
                std::string err = check_object(el, *f.items, at);
                if (!err.empty()) return err;
            } else if (!matches(el, f.item_type)) {
                return at + ": expected " + type_name(f.item_type);
            }
        }
    }
    return "";
}

} // namespace

bool is_known(const std::string& ref) {
    return registry().count(ref) != 0;
}

std::vector<std::string> names() {
    std::vector<std::string> out;
    for (const auto& kv : registry()) out.push_back(kv.first);
    return out;
}

std::string validate(const std::string& ref, json_object* doc) {
    auto it = registry().find(ref);
    if (it == registry().end()) return "";
    return check_object(doc, *it->second, "");
}

} // namespace dawn::schemas
