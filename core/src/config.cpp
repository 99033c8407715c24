#include "dawn/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace dawn {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

Env detect_env() {
    const char* env = std::getenv("DAWN_ENV");
    if (!env) return Env::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Env::PROD;
    return Env::DEV;
}

const char* env_name(Env e) {
    switch (e) {
        case Env::PROD: return "prod";
        case Env::DEV:  return "dev";
    }
    return "dev";
}

void apply_env_defaults(Env e) {
    // Must run before any link process is forked.
    constexpr int NO_OVERWRITE = 0;

    switch (e) {
        case Env::DEV:
            setenv("DAWN_LEDGER_FSYNC",   "0",    NO_OVERWRITE);
            setenv("DAWN_PLUGIN_ABI_LAX", "1",    NO_OVERWRITE);
            setenv("DAWN_LOG_LEVEL",      "info", NO_OVERWRITE);
            break;

        case Env::PROD:
            setenv("DAWN_LEDGER_FSYNC",   "1",    NO_OVERWRITE);
            setenv("DAWN_PLUGIN_ABI_LAX", "0",    NO_OVERWRITE);
            setenv("DAWN_LOG_LEVEL",      "warn", NO_OVERWRITE);
            break;
    }
}

LogLevel log_level() {
    const char* v = std::getenv("DAWN_LOG_LEVEL");
    if (!v) return LogLevel::INFO;
    std::string s = lower(v);
    if (s == "error") return LogLevel::ERROR;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    return LogLevel::INFO;
}

void log_line(LogLevel level, const std::string& msg) {
    if ((int)level > (int)log_level()) return;
    const char* tag = "[INFO] ";
    if (level == LogLevel::ERROR) tag = "[ERROR] ";
    else if (level == LogLevel::WARN) tag = "[WARN] ";
    std::cerr << tag << msg << "\n";
}

bool env_flag(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = lower(v);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

static std::filesystem::path env_path_or(const char* key, const std::filesystem::path& defv) {
    const char* v = std::getenv(key);
    if (v && *v) return std::filesystem::path(v);
    return defv;
}

RuntimeConfig load_runtime_config(const std::filesystem::path& root) {
    RuntimeConfig cfg;
    cfg.root = root;
    cfg.policy_path = env_path_or("DAWN_POLICY_PATH", root / "policy" / "runtime_policy.yaml");
    cfg.links_dir = env_path_or("DAWN_LINKS_DIR", root / "links");
    cfg.projects_dir = env_path_or("DAWN_PROJECTS_DIR", root / "projects");
    cfg.plugin_dir = env_path_or("DAWN_PLUGIN_DIR", {});
    if (const char* p = std::getenv("DAWN_PROFILE")) cfg.profile = p;
    cfg.ledger_fsync = env_flag("DAWN_LEDGER_FSYNC");
    cfg.plugin_abi_lax = env_flag("DAWN_PLUGIN_ABI_LAX");
    return cfg;
}

} // namespace dawn
