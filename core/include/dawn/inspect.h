#pragma once

#include "dawn/json_mini.h"
#include "dawn/ledger.h"
#include "dawn/shadow.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace dawn {

// One pipeline run as reconstructed from ledger events sharing metrics.run_id.
struct RunRecord {
    std::string run_id;
    std::string status;     // SUCCEEDED | FAILED | UNKNOWN
    double started_at{0.0};
    double ended_at{0.0};
    size_t events{0};
    std::vector<std::string> links;
};

// Newest first.
std::vector<RunRecord> run_history(const std::vector<json_mini::Doc>& events);

struct ProjectStatus {
    std::string project_id;
    size_t event_count{0};
    // link id -> status of its last event, in first-seen order
    std::vector<std::pair<std::string, std::string>> last_status;
    // Rebuilt from link_complete outputs.
    json_mini::Doc artifact_index;
    std::vector<RunRecord> runs;
    std::vector<ShadowMaturity> shadows;
    ChainReport chain;
};

// Throws PipelineError when the project directory does not exist.
ProjectStatus inspect_project(const std::filesystem::path& project_root, const std::string& project_id);

} // namespace dawn
