#pragma once

#include "dawn/artifact_store.h"
#include "dawn/coherence.h"
#include "dawn/errors.h"
#include "dawn/json_mini.h"
#include "dawn/ledger.h"
#include "dawn/link_api.h"
#include "dawn/pipeline.h"
#include "dawn/policy.h"
#include "dawn/registry.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dawn {

// Mutable state of one pipeline run. Returned by runPipeline on success.
struct ProjectContext {
    std::string project_id;
    std::string pipeline_id;
    std::string pipeline_run_id;
    std::string worker_id;
    std::string profile;
    std::filesystem::path project_root;

    // artifact id -> {path, digest, link_id, run_id, created_at}
    json_mini::Doc artifact_index;
    // link id -> SUCCEEDED | FAILED | SKIPPED
    std::map<std::string, std::string> status_index;
    // Links skipped because an identical execution already succeeded.
    std::set<std::string> reused_links;
    // link id -> {duration_ms, skipped[, reason][, error][, metrics]}
    json_mini::Doc link_durations;
    // [{link_id, type, ...}]
    json_mini::Doc budget_violations;
    int64_t lock_wait_time_ms{0};

    bool failed{false};
    std::string failure_link;
    std::string failure_error;
    ErrorKind failure_kind{ErrorKind::RUNTIME_ERROR};
};

struct OrchestratorOptions {
    // Empty: policy default_profile.
    std::string profile;
    // Empty: hostname:pid.
    std::string worker_id;
    bool ledger_fsync{false};
    // Null: StructuralCoherenceScorer.
    std::shared_ptr<const ICoherenceScorer> scorer;
};

// Runs pipelines against project directories under projects_dir.
//
// Holds no per-run state; every runPipeline call owns its ProjectContext,
// ledger handle and artifact store. The project lock serializes runs on the
// same project across processes.
class Orchestrator {
public:
    Orchestrator(const PolicyLoader& policy,
                 const LinkRegistry& registry,
                 const LinkTable& links,
                 std::filesystem::path projects_dir,
                 OrchestratorOptions opts = {});

    // Executes the pipeline for project_id.
    //
    // Throws PipelineError (spec references unknown links, bad project id),
    // PolicyValidationError (unknown profile), ProjectBusyError (lock held),
    // PipelineRunError (a link failed or the project exceeded its size
    // budget; index and run summary are persisted first in the former case).
    ProjectContext runPipeline(const std::string& project_id, const PipelineSpec& spec,
                               const std::string& profile = "");
    ProjectContext runPipeline(const std::string& project_id, const std::filesystem::path& pipeline_path,
                               const std::string& profile = "");

    // Records a human approval for a shadow that reached its parity window.
    // Throws PipelineError when the pair is unknown or not ready.
    void approveShadowPromotion(const std::string& project_id, const std::string& stable_link,
                                const std::string& shadow_link, const std::string& approver);

    std::filesystem::path project_root(const std::string& project_id) const;
    const std::string& worker_id() const { return worker_id_; }
    const std::string& default_profile() const { return profile_; }

private:
    struct PreparedLink {
        std::string id;
        json_mini::Doc manifest;   // merged with pipeline overrides
        LinkContract contract;
        const LinkFn* fn{nullptr};
    };

    struct PreparedEntry {
        PreparedLink link;
        std::optional<PreparedLink> shadow;
        double parity_threshold{0.9};
    };

    struct RunHandles {
        Ledger& ledger;
        ArtifactStore& store;
        const PipelineSpec& spec;
    };

    struct LinkRun {
        std::string status;        // SUCCEEDED | SKIPPED
        json_mini::Doc metrics;
    };

    std::vector<PreparedEntry> prepare(const PipelineSpec& spec) const;
    PreparedLink prepare_link(const PipelineSpec& spec, const PipelineEntry* entry, const std::string& id) const;

    ProjectContext runLocked(const std::string& project_id, const PipelineSpec& spec,
                             std::vector<PreparedEntry>& entries, const std::string& profile,
                             int64_t lock_wait_ms);

    LinkRun executeLink(ProjectContext& ctx, RunHandles& h, const PreparedLink& link);
    void runShadow(ProjectContext& ctx, RunHandles& h, const PreparedLink& stable,
                   const PreparedLink& shadow, double parity_threshold);

    void checkProjectSize(ProjectContext& ctx, Ledger& ledger);
    bool evaluateCondition(const ProjectContext& ctx, const WhenCondition& when) const;
    std::string inputSignature(const ProjectContext& ctx, const ArtifactStore& store,
                               const PreparedLink& link) const;
    void validateInputs(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                        const std::string& link_run_id);
    json_mini::Doc validateOutputs(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                                   const std::string& link_run_id);
    void checkCoherence(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                        const std::string& link_run_id, json_object* outputs);
    // Writes artifacts/package.metrics/run_summary.json and indexes it.
    // Returns empty string on success.
    std::string writeRunSummary(ProjectContext& ctx, const PipelineSpec& spec, double started_at,
                                double ended_at, int64_t duration_ms);

    LinkContext link_context(const ProjectContext& ctx, const ArtifactStore& store, const PreparedLink& link,
                             ILinkSandbox* sandbox, const std::string& link_run_id) const;
    int link_timeout(const ProjectContext& ctx, const PreparedLink& link) const;

    LedgerEvent make_event(const ProjectContext& ctx, const std::string& link_id, const std::string& run_id,
                           const std::string& step_id, const std::string& status,
                           const std::string& contract_version = "") const;
    json_mini::Doc run_metrics(const ProjectContext& ctx) const;
    // Writes a FAILED event at step_id and returns the matching logged LinkFailure.
    LinkFailure fail_logged(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                            const std::string& link_run_id, const std::string& step_id,
                            ErrorKind kind, const std::string& message, json_mini::Doc extra = {});

    const PolicyLoader& policy_;
    const LinkRegistry& registry_;
    const LinkTable& links_;
    std::filesystem::path projects_dir_;
    std::string profile_;
    std::string worker_id_;
    bool ledger_fsync_;
    std::shared_ptr<const ICoherenceScorer> scorer_;
};

} // namespace dawn
