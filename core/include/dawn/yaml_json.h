#pragma once

#include "dawn/json_mini.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>

namespace dawn {

// Converts a YAML node into a json-c tree. Plain scalars are typed
// (bool, null, integer, float, string); quoted scalars always stay strings.
json_object* yaml_to_json(const YAML::Node& node);

// Loads a YAML file into JSON. Throws std::runtime_error with the file
// name on I/O or syntax errors.
json_mini::Doc load_yaml_file(const std::filesystem::path& path);

// Emits a json-c tree as block-style YAML.
std::string json_to_yaml(json_object* obj);

} // namespace dawn
