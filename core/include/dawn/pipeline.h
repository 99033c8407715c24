#pragma once

#include "dawn/json_mini.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dawn {

struct ShadowSpec {
    std::string link;
    double parity_threshold{0.9};
};

struct PipelineEntry {
    std::string id;
    // Both nullable. config merges into the manifest's `config`,
    // overrides into the manifest root.
    std::shared_ptr<const json_mini::Doc> config;
    std::shared_ptr<const json_mini::Doc> overrides;
    std::optional<ShadowSpec> shadow;
};

// Ordered list of link references plus per-link overrides. Immutable once loaded.
struct PipelineSpec {
    std::string pipeline_id{"default"};
    std::filesystem::path path;
    std::string digest;     // SHA-256 of the file bytes ("" when parsed from memory)
    std::vector<PipelineEntry> links;
    // link id -> patch merged onto that link's manifest
    std::shared_ptr<const json_mini::Doc> overrides;
    int shadow_parity_window{3};
    std::shared_ptr<const json_mini::Doc> document;

    json_object* overrides_for(const std::string& link_id) const;
};

// Throws PipelineError on I/O, YAML or structural errors.
PipelineSpec load_pipeline_spec(const std::filesystem::path& path);
PipelineSpec parse_pipeline_spec(json_object* doc);

} // namespace dawn
