#include "test_common.h"
#include "dawn/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default environment is DEV
    unsetenv("DAWN_ENV");
    auto e = dawn::detect_env();
    expect_true(e == dawn::Env::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("DAWN_ENV", "PROD", 1);
    e = dawn::detect_env();
    expect_true(e == dawn::Env::PROD, "should detect PROD case-insensitive");
    setenv("DAWN_ENV", "production", 1);
    expect_true(dawn::detect_env() == dawn::Env::PROD, "production alias");

    // Test 3: Apply defaults (won't override existing)
    setenv("DAWN_LEDGER_FSYNC", "0", 1);
    dawn::apply_env_defaults(dawn::Env::PROD);
    std::string val = std::getenv("DAWN_LEDGER_FSYNC") ? std::getenv("DAWN_LEDGER_FSYNC") : "";
    expect_true(val == "0", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    unsetenv("DAWN_PLUGIN_ABI_LAX");
    dawn::apply_env_defaults(dawn::Env::PROD);
    expect_true(!dawn::env_flag("DAWN_PLUGIN_ABI_LAX"), "PROD requires plugin ABI export");
    unsetenv("DAWN_PLUGIN_ABI_LAX");
    dawn::apply_env_defaults(dawn::Env::DEV);
    expect_true(dawn::env_flag("DAWN_PLUGIN_ABI_LAX"), "DEV accepts plugins without ABI export");

    // Test 5: Names
    expect_true(std::string(dawn::env_name(dawn::Env::DEV)) == "dev", "dev name");
    expect_true(std::string(dawn::env_name(dawn::Env::PROD)) == "prod", "prod name");

    // Test 6: Runtime config from environment
    unsetenv("DAWN_POLICY_PATH");
    unsetenv("DAWN_PLUGIN_DIR");
    setenv("DAWN_PROJECTS_DIR", "/tmp/dawn_projects_override", 1);
    setenv("DAWN_PROFILE", "isolation", 1);
    setenv("DAWN_LEDGER_FSYNC", "yes", 1);
    auto cfg = dawn::load_runtime_config("/opt/dawn");
    expect_true(cfg.policy_path == std::filesystem::path("/opt/dawn/policy/runtime_policy.yaml"),
                "default policy path");
    expect_true(cfg.links_dir == std::filesystem::path("/opt/dawn/links"), "default links dir");
    expect_true(cfg.projects_dir == std::filesystem::path("/tmp/dawn_projects_override"), "projects dir override");
    expect_true(cfg.plugin_dir.empty(), "no plugin dir by default");
    expect_true(cfg.profile == "isolation", "profile from env");
    expect_true(cfg.ledger_fsync, "fsync flag parsed");

    // Test 7: Log level parsing
    setenv("DAWN_LOG_LEVEL", "WARNING", 1);
    expect_true(dawn::log_level() == dawn::LogLevel::WARN, "warning alias");
    setenv("DAWN_LOG_LEVEL", "error", 1);
    expect_true(dawn::log_level() == dawn::LogLevel::ERROR, "error level");

    // Cleanup
    unsetenv("DAWN_ENV");
    unsetenv("DAWN_LEDGER_FSYNC");
    unsetenv("DAWN_PLUGIN_ABI_LAX");
    unsetenv("DAWN_PROJECTS_DIR");
    unsetenv("DAWN_PROFILE");
    unsetenv("DAWN_LOG_LEVEL");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
