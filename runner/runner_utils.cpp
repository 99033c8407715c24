#include "runner_utils.h"

#include <cstdlib>
#include <iostream>

namespace dawn {

static void warn_sensitive_root(const std::filesystem::path& root) {
    static const std::vector<std::string> sensitive = {"/", "/etc", "/usr", "/var", "/home", "/root", "/tmp"};
    std::error_code ec;
    auto canon = std::filesystem::weakly_canonical(root, ec);
    if (ec) return;
    for (const auto& s : sensitive) {
        if (canon == std::filesystem::path(s)) {
            log_line(LogLevel::WARN, "DAWN_ROOT points to sensitive directory: " + canon.string());
            break;
        }
    }
}

std::filesystem::path resolve_root(const char* argv0) {
    std::error_code ec;
    if (const char* e = std::getenv("DAWN_ROOT")) {
        std::filesystem::path p = e;
        if (std::filesystem::exists(p, ec)) {
            auto result = std::filesystem::canonical(p, ec);
            if (!ec) {
                warn_sensitive_root(result);
                return result;
            }
        }
    }
    std::filesystem::path exe = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
    if (!exe.empty() && !exe.is_absolute()) exe = std::filesystem::absolute(exe, ec);
    if (!exe.empty() && std::filesystem::exists(exe, ec)) {
        auto canon = std::filesystem::canonical(exe, ec);
        if (!ec) exe = canon;
    }
    std::filesystem::path dir = exe.empty() ? std::filesystem::current_path() : exe.parent_path();
    // walk up looking for a repo root (links directory)
    for (int i = 0; i < 8; i++) {
        if (std::filesystem::is_directory(dir / "links", ec)) {
            warn_sensitive_root(dir);
            return dir;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    auto result = std::filesystem::current_path();
    warn_sensitive_root(result);
    return result;
}

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
    setenv(key, value.c_str(), 0);
}

std::optional<std::string> CliArgs::option(const std::string& name) const {
    for (const auto& kv : options) {
        if (kv.first == name) return kv.second;
    }
    return std::nullopt;
}

bool CliArgs::has_switch(const std::string& name) const {
    for (const auto& s : switches) {
        if (s == name) return true;
    }
    return false;
}

CliArgs parse_cli_args(int argc, char** argv, int first, const std::vector<std::string>& value_flags) {
    CliArgs a;
    for (int i = first; i < argc; i++) {
        std::string s = argv[i];
        if (s.rfind("--", 0) != 0) {
            a.positional.push_back(s);
            continue;
        }
        auto eq = s.find('=');
        if (eq != std::string::npos) {
            a.options.emplace_back(s.substr(0, eq), s.substr(eq + 1));
            continue;
        }
        bool takes_value = false;
        for (const auto& f : value_flags) takes_value = takes_value || f == s;
        if (takes_value && i + 1 < argc) {
            a.options.emplace_back(s, argv[++i]);
        } else {
            a.switches.push_back(s);
        }
    }
    return a;
}

void print_json(json_object* o, bool pretty) {
    std::cout << (pretty ? json_mini::serialize_sorted(o, 2) : json_mini::to_compact(o)) << "\n";
}

std::string short_digest(const std::string& d, size_t n) {
    return d.size() > n ? d.substr(0, n) : d;
}

} // namespace dawn
