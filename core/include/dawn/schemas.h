#pragma once

#include "dawn/json_mini.h"

#include <string>
#include <vector>

namespace dawn {

// Named structural schemas for JSON artifacts (schema.ref in a link contract).
//
// A schema is a tree of object rules: required keys, expected value types and,
// for arrays of objects, the rule every element must satisfy.
namespace schemas {

enum class Type { ANY, STRING, NUMBER, BOOLEAN, OBJECT, ARRAY, STRING_OR_NULL };

struct ObjectRule;

struct Field {
    const char* key;
    Type type;
    bool required;
    const ObjectRule* items{nullptr};   // ARRAY of objects
    Type item_type{Type::ANY};          // ARRAY of scalars
};

struct ObjectRule {
    std::vector<Field> fields;
};

bool is_known(const std::string& ref);
std::vector<std::string> names();

// Empty string when doc conforms; otherwise the first violation, with a
// JSON-pointer-like location ("nodes[2].role: required").
// Unknown refs validate as OK.
std::string validate(const std::string& ref, json_object* doc);

} // namespace schemas
} // namespace dawn
