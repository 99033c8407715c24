#pragma once

#include "dawn/artifact_store.h"
#include "dawn/json_mini.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dawn {

// Rolling parity record of one stable/shadow pair.
struct ShadowMaturity {
    std::string stable;
    std::string shadow;
    int runs{0};
    int consecutive_parity{0};
    double last_parity{0.0};
    bool ready{false};      // window reached, waiting for approval
    bool approved{false};
    std::string approved_by;
    std::string approved_at;
};

// shadow/maturity.json, keyed by stable link id (one shadow per stable link).
class ShadowState {
public:
    explicit ShadowState(const std::filesystem::path& project_root);

    // Reads the file if present. Unreadable content starts from scratch with a WARN.
    void load();
    // Atomic rewrite. Returns empty string on success.
    std::string save() const;

    // Creates the entry when missing. A different shadow for the same stable
    // link restarts the counters.
    ShadowMaturity& entry(const std::string& stable, const std::string& shadow);
    const ShadowMaturity* find(const std::string& stable) const;
    std::vector<ShadowMaturity> entries() const;

    // Folds one parity observation in; returns true when this observation
    // made the pair ready for promotion.
    bool record_parity(ShadowMaturity& m, double parity, double threshold, int window);

    const std::filesystem::path& path() const { return path_; }

    static std::filesystem::path shadow_root(const std::filesystem::path& project_root);

private:
    std::filesystem::path path_;
    std::map<std::string, ShadowMaturity> pairs_;
};

// Mean per-artifact parity between what the stable link produced and what
// the shadow produced under the same artifact ids. JSON documents with a
// nodes[] array compare by node-set overlap, everything else by digest.
// An artifact the shadow did not produce scores 0. No stable artifacts: 1.
double artifact_parity(const std::vector<ArtifactRecord>& stable, const ArtifactStore& shadow_store);

} // namespace dawn
