#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) die(msg + " (got='" + a + "', want='" + b + "')");
}

// Empty scratch directory under the system temp dir.
inline std::filesystem::path fresh_dir(const std::string& name) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    if (ec) die("cannot create " + dir.string() + ": " + ec.message());
    return dir;
}

inline void write_text(const std::filesystem::path& p, const std::string& body) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) die("cannot write " + p.string());
    f << body;
}

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return "";
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// A complete v2 runtime policy with adjustable budgets.
inline std::string policy_yaml(long long max_wall_time_sec = 60,
                               long long max_output_bytes = 10485760,
                               long long max_project_bytes = 104857600) {
    return "version: \"2.0.0\"\n"
           "budgets:\n"
           "  per_link:\n"
           "    max_wall_time_sec: " + std::to_string(max_wall_time_sec) + "\n"
           "    max_output_bytes: " + std::to_string(max_output_bytes) + "\n"
           "  per_project:\n"
           "    max_project_bytes: " + std::to_string(max_project_bytes) + "\n"
           "retry:\n"
           "  max_retries_per_link: 3\n"
           "  max_retries_per_project: 10\n"
           "  backoff_schedule: [1, 5, 30]\n"
           "  retryable_errors: [BUDGET_TIMEOUT, RUNTIME_ERROR]\n"
           "  non_retryable_errors: [POLICY_VIOLATION, SCHEMA_INVALID]\n"
           "retention:\n"
           "  keep_last_n_runs: 1\n"
           "  keep_failed_runs_days: 7\n"
           "  protected_artifacts: [dawn.metrics.run_summary]\n"
           "  preserve_ledger: true\n"
           "security:\n"
           "  allowed_subprocess_commands: [git]\n"
           "  allow_src_writes: [impl.apply_patchset]\n"
           "default_profile: normal\n"
           "profiles:\n"
           "  normal:\n"
           "    allow_src_writes: true\n"
           "    artifact_only_outputs: false\n"
           "    timeout_multiplier: 1.0\n"
           "  isolation:\n"
           "    allow_src_writes: false\n"
           "    artifact_only_outputs: true\n"
           "    timeout_multiplier: 1.0\n"
           "    allowed_subprocess_commands: []\n"
           "  ci:\n"
           "    allow_src_writes: false\n"
           "    artifact_only_outputs: true\n"
           "    timeout_multiplier: 2.5\n";
}

// links/<id>/link.yaml producing one JSON artifact.
inline void write_link_manifest(const std::filesystem::path& links_dir, const std::string& id,
                                const std::string& spec_body, const std::string& extra = "") {
    write_text(links_dir / id / "link.yaml",
               "apiVersion: dawn.links/v1\n"
               "kind: Link\n"
               "contractVersion: \"1.0.0\"\n"
               "metadata:\n"
               "  name: " + id + "\n"
               "spec:\n" + spec_body + extra);
}
