#pragma once

#include "dawn/json_mini.h"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dawn {

// One entry of a link's requires[] or produces[] list.
struct ArtifactRef {
    std::string artifact_id;
    bool optional{false};
    std::string schema_type;   // "json", "text", ... (empty: untyped)
    std::string schema_ref;    // named structural schema, e.g. dawn.project.ir
    std::string from_link;     // preferred producer (diagnostics only)
    std::string path;          // legacy produces: relative to artifacts/<link>/
};

// Parsed `when.condition`. Malformed strings are rejected at load time.
struct WhenCondition {
    enum class Kind { ALWAYS, ON_SUCCESS, ON_FAILURE, IF_ARTIFACT_EXISTS };

    Kind kind{Kind::ALWAYS};
    std::string target;

    static WhenCondition parse(const std::string& text);
    std::string to_string() const;
};

struct CoherencePolicy {
    enum class OnDrift { FAIL, WARN, REFLECT };

    double threshold{0.8};
    OnDrift on_drift{OnDrift::WARN};
    std::string artifact;                       // empty: first JSON produce
    std::string baseline{"dawn.project.ir"};
};

const char* on_drift_name(CoherencePolicy::OnDrift d);

struct RuntimeHints {
    bool always_run{false};
    std::optional<int> max_wall_time_sec;
};

struct LinkContract {
    std::string id;
    std::string contract_version{"1.0.0"};
    std::vector<ArtifactRef> requires_;
    std::vector<ArtifactRef> produces;
    WhenCondition when;
    RuntimeHints runtime;
    std::optional<CoherencePolicy> coherence;
};

// Parses a link manifest document (link.yaml converted to JSON).
// Throws PipelineError on a missing metadata.name or a malformed field.
LinkContract parse_link_contract(json_object* manifest);

ArtifactRef parse_artifact_ref(json_object* v);

// A discovered link: where it lives and what it declares. The manifest is
// kept whole so pipeline overrides can be merged onto it per run.
struct LinkEntry {
    std::string id;
    std::filesystem::path dir;
    std::shared_ptr<const json_mini::Doc> manifest;
    LinkContract contract;
};

// Registry holds every link manifest found under the links directory.
class LinkRegistry {
public:
    // Scans immediate subdirectories for link.yaml. Directories without a
    // manifest are skipped. Returns the number of links registered.
    size_t discover(const std::filesystem::path& links_dir);

    // Parses and registers one manifest file.
    void loadManifest(const std::filesystem::path& manifest_path);

    // Duplicate ids throw unless allow_override is set.
    void registerLink(LinkEntry e, bool allow_override = false);

    const LinkEntry* getLink(const std::string& id) const;
    std::vector<std::string> listLinks() const;
    size_t size() const { return links_.size(); }

private:
    std::unordered_map<std::string, LinkEntry> links_;
};

} // namespace dawn
