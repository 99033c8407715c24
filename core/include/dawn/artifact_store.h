#pragma once

#include "dawn/json_mini.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dawn {

struct ArtifactRecord {
    std::string artifact_id;
    std::filesystem::path path;     // absolute
    std::string digest;             // SHA-256 of the file bytes at registration
    std::string schema;
    std::string producer_link_id;
    std::string blob_uri;           // optional external copy

    // {path, digest, schema, producer_link_id[, blob_uri]}
    json_mini::Doc to_json() const;
    static std::optional<ArtifactRecord> from_json(const std::string& artifact_id, json_object* o);
};

// Content-addressed registry of link outputs for one project (or one
// shadow output root). Digests are always computed here from the file on
// disk, never accepted from the caller.
class ArtifactStore {
public:
    // artifacts_dir defaults to <project_root>/artifacts.
    explicit ArtifactStore(std::filesystem::path project_root, std::filesystem::path artifacts_dir = {});

    // Throws std::runtime_error when the file does not exist or cannot be read.
    const ArtifactRecord& register_artifact(const std::string& artifact_id,
                                            const std::filesystem::path& path,
                                            const std::string& schema,
                                            const std::string& producer_link_id,
                                            const std::string& blob_uri = "");

    const ArtifactRecord* get(const std::string& artifact_id) const;
    std::vector<std::string> list_artifacts() const;
    std::vector<ArtifactRecord> records_for_link(const std::string& link_id) const;

    // Drops every record produced by link_id (a re-execution supersedes them).
    void forget_link(const std::string& link_id);

    // <artifacts_dir>/<link_id>, created on demand.
    std::filesystem::path link_dir(const std::string& link_id) const;

    // Writes <link_dir>/.dawn_artifacts.json. Returns empty string on success.
    std::string save_manifest(const std::string& link_id) const;

    // Re-registers records from the link manifest whose file still exists
    // and still hashes to the recorded digest. Returns the count.
    int rehydrate_from_link_dir(const std::string& link_id);

    const std::filesystem::path& project_root() const { return project_root_; }
    const std::filesystem::path& artifacts_dir() const { return artifacts_dir_; }

    // Streaming SHA-256 of a file. Throws std::runtime_error when unreadable.
    static std::string get_digest(const std::filesystem::path& path);

    static constexpr const char* kManifestName = ".dawn_artifacts.json";

private:
    std::filesystem::path project_root_;
    std::filesystem::path artifacts_dir_;
    std::map<std::string, ArtifactRecord> records_;
};

// --- artifact_index.json ---
// artifact id -> {path, digest, link_id, run_id, created_at}

json_mini::Doc load_artifact_index(const std::filesystem::path& project_root);
// Atomic rewrite. Returns empty string on success.
std::string save_artifact_index(const std::filesystem::path& project_root, json_object* index);
json_mini::Doc index_entry(const ArtifactRecord& rec, const std::string& run_id);

} // namespace dawn
