#pragma once

#include "dawn/errors.h"
#include "dawn/json_mini.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dawn {

// Ceiling for any link wall-time limit (one week).
constexpr int kMaxLinkTimeoutSec = 7 * 24 * 3600;

struct ProfileConfig {
    std::string name;
    bool allow_src_writes{false};
    bool artifact_only_outputs{false};
    double timeout_multiplier{1.0};
    // Overrides security.allowed_subprocess_commands when present.
    std::optional<std::vector<std::string>> allowed_subprocess_commands;
};

// Loads, validates and digests the runtime policy (YAML).
//
// Constructed once per process and passed to the orchestrator explicitly.
// A failed load() leaves the loader unloaded: no policy, no digest.
class PolicyLoader {
public:
    explicit PolicyLoader(std::filesystem::path path);

    PolicyLoader(const PolicyLoader&) = delete;
    PolicyLoader& operator=(const PolicyLoader&) = delete;

    // Throws PolicyValidationError on: missing/empty file, malformed YAML,
    // missing required key, unknown default_profile, version below 2.0.0,
    // legacy `limits` block.
    void load();

    bool is_loaded() const { return loaded_; }
    const std::filesystem::path& path() const { return path_; }

    // The accessors below throw std::runtime_error before a successful load().
    const std::string& version() const;
    // SHA-256 of the canonical sorted-key JSON form of the document.
    const std::string& digest() const;
    const std::string& default_profile() const;
    json_object* document() const;

    // Empty name selects default_profile. Unknown name: PolicyValidationError.
    const ProfileConfig& get_profile(const std::string& name = "") const;
    std::vector<std::string> profile_names() const;

    std::optional<int64_t> get_budget(const std::string& section, const std::string& key) const;

    // floor(max_wall_time_sec * timeout_multiplier); base defaults to 60.
    // Clamped to [1, kMaxLinkTimeoutSec].
    int effective_timeout(const std::string& profile = "") const;

    // Profile is the ceiling, security.allow_src_writes the grant.
    bool is_src_write_allowed(const std::string& link_id, const std::string& profile = "") const;
    std::vector<std::string> allowed_subprocess_commands(const std::string& profile = "") const;

    // --- retry ---
    int max_retries_per_link() const;
    int max_retries_per_project() const;
    // attempt is 0-based; past the schedule the last value repeats
    int backoff_seconds(int attempt) const;
    std::vector<std::string> retryable_errors() const;
    std::vector<std::string> non_retryable_errors() const;
    // Non-retryable wins over retryable; unlisted kinds are not retryable.
    bool is_error_retryable(const std::string& kind) const;

    // --- retention ---
    int keep_last_n_runs() const;
    int keep_failed_runs_days() const;
    std::vector<std::string> protected_artifacts() const;
    bool preserve_ledger() const;

    // {version, digest, default_profile, budgets, retry, retention}
    json_mini::Doc to_json() const;

private:
    void require_loaded() const;
    json_object* section(const char* key) const;

    std::filesystem::path path_;
    json_mini::Doc doc_;
    bool loaded_{false};
    std::string version_;
    std::string digest_;
    std::string default_profile_;
    std::map<std::string, ProfileConfig> profiles_;
};

} // namespace dawn
