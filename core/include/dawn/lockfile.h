#pragma once

#include "dawn/json_mini.h"
#include "dawn/policy.h"

#include <filesystem>
#include <string>
#include <vector>

namespace dawn {

inline constexpr const char* kLockfileName = "dawn.lock.json";
inline constexpr const char* kLockfileVersion = "1.0.0";

struct LockMismatch {
    std::string component;   // "policy", "pipeline", "link:<id>", "environment"
    std::string field;
    std::string expected;
    std::string actual;
};

struct LockVerifyResult {
    bool verified{false};
    std::string error;          // lockfile missing or unreadable
    std::string lockfile_version;
    std::string generated_at;
    std::vector<LockMismatch> mismatches;
};

// Reproducibility lockfile of a project: digests of the policy, the
// persisted pipeline.yaml, every link manifest it references and every
// indexed artifact, plus the build environment.
class Lockfile {
public:
    Lockfile(const PolicyLoader& policy, std::filesystem::path projects_dir, std::filesystem::path links_dir);

    // Throws PipelineError when the project directory does not exist.
    json_mini::Doc generate(const std::string& project_id) const;
    // Writes <project>/dawn.lock.json; generates first when lock is null.
    // Throws std::runtime_error on write failure.
    std::filesystem::path save(const std::string& project_id, json_object* lock = nullptr) const;
    // Throws std::runtime_error when absent or not a JSON object.
    json_mini::Doc load(const std::string& project_id) const;

    LockVerifyResult verify(const std::string& project_id) const;

private:
    std::filesystem::path project_root(const std::string& project_id) const;

    const PolicyLoader& policy_;
    std::filesystem::path projects_dir_;
    std::filesystem::path links_dir_;
};

// Top-level keys whose values differ, generated_at excluded. Sorted.
std::vector<std::string> compare_lockfiles(json_object* a, json_object* b);

// "<compiler> <version>" of the running binary.
std::string compiler_identity();

} // namespace dawn
