#pragma once

#include "dawn/config.h"
#include "dawn/json_mini.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dawn {

// DAWN_ROOT if it exists, else the first ancestor of the executable that
// holds a links/ directory, else the current directory.
std::filesystem::path resolve_root(const char* argv0);
void set_env_if_missing(const char* key, const std::string& value);

// Positional arguments after argv[first], with "--flag value" pairs and
// bare "--switch" flags split out.
struct CliArgs {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> switches;

    std::optional<std::string> option(const std::string& name) const;
    bool has_switch(const std::string& name) const;
};

// value_flags lists the flags that take a value ("--profile").
CliArgs parse_cli_args(int argc, char** argv, int first, const std::vector<std::string>& value_flags);

void print_json(json_object* o, bool pretty = false);
std::string short_digest(const std::string& d, size_t n = 12);

} // namespace dawn
