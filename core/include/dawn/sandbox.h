#pragma once

#include "dawn/link_api.h"

#include <filesystem>
#include <string>
#include <vector>

namespace dawn {

class ArtifactStore;

// One artifact handed over through publish()/publish_text().
struct PublishedArtifact {
    std::string artifact_id;
    std::filesystem::path path;
    std::string schema;
};

// Per-link write facade rooted at <artifacts_dir>/<link_id>/.
//
// Links are expected to write only through it; the orchestrator's snapshot
// diff catches the ones that do not.
class Sandbox : public ILinkSandbox {
public:
    // store may be null; publishes are then only recorded.
    Sandbox(const std::filesystem::path& artifacts_dir, const std::string& link_id, ArtifactStore* store);

    const std::filesystem::path& root() const override { return root_; }
    const std::string& link_id() const { return link_id_; }

    std::filesystem::path write_json(const std::string& rel, json_object* obj) override;
    std::filesystem::path write_text(const std::string& rel, const std::string& text) override;
    std::filesystem::path copy_in(const std::filesystem::path& src, const std::string& rel) override;

    std::filesystem::path publish(const std::string& artifact_id, const std::string& rel,
                                  json_object* obj, const std::string& schema = "json") override;
    std::filesystem::path publish_text(const std::string& artifact_id, const std::string& rel,
                                       const std::string& text, const std::string& schema = "text") override;

    const std::vector<PublishedArtifact>& published() const { return published_; }

private:
    std::filesystem::path resolve(const std::string& rel) const;
    void record(const std::string& artifact_id, const std::filesystem::path& path, const std::string& schema);

    std::filesystem::path root_;
    std::string link_id_;
    ArtifactStore* store_;
    std::vector<PublishedArtifact> published_;
};

} // namespace dawn
