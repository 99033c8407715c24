#pragma once

#include <filesystem>
#include <string>

namespace dawn {

enum class Env { DEV, PROD };

// Detect environment from DAWN_ENV. Default: DEV.
Env detect_env();

const char* env_name(Env e);

// Sets env vars that are not already set.
// DEV: no ledger fsync, lax plugin ABI check
// PROD: fsync every ledger append, plugins must export their ABI version
void apply_env_defaults(Env e);

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2 };

// DAWN_LOG_LEVEL = error|warn|info (default info)
LogLevel log_level();

// Single diagnostic line on stderr: "[WARN] msg". Filtered by log_level().
void log_line(LogLevel level, const std::string& msg);

bool env_flag(const char* key);

// Paths and knobs for one process, resolved once at startup.
struct RuntimeConfig {
    std::filesystem::path root;
    std::filesystem::path policy_path;
    std::filesystem::path links_dir;
    std::filesystem::path projects_dir;
    std::filesystem::path plugin_dir;   // empty: no out-of-tree plugins
    std::string profile;                // empty: policy default_profile
    bool ledger_fsync{false};
    bool plugin_abi_lax{false};
};

// Resolve the configuration from DAWN_* environment variables, relative to root.
RuntimeConfig load_runtime_config(const std::filesystem::path& root);

} // namespace dawn
