#pragma once

#include "dawn/json_mini.h"
#include "dawn/policy.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dawn {

struct PruneItem {
    std::string artifact_id;
    std::string reason;
    std::string path;
    uint64_t size_bytes{0};
};

struct PruneReport {
    std::string project_id;
    bool dry_run{true};
    std::vector<PruneItem> preserved;
    std::vector<PruneItem> deleted;
    std::vector<PruneItem> errors;   // reason holds the error text
    uint64_t space_freed_bytes{0};

    json_mini::Doc to_json() const;
};

// Applies the policy retention rules to one project's indexed artifacts.
//
// Kept: protected artifact ids, artifacts written by (or reused in) one of the
// last keep_last_n_runs successful runs or a failed run younger than
// keep_failed_runs_days, and artifacts with no run id. Everything else is
// deleted and dropped from the index. The ledger is never touched.
// Takes the project lock unless dry_run.
PruneReport prune_project(const PolicyLoader& policy, const std::filesystem::path& project_root,
                          const std::string& project_id, bool dry_run);

} // namespace dawn
