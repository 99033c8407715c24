#include "dawn/orchestrator.h"
#include "dawn/config.h"
#include "dawn/crypto.h"
#include "dawn/fs_guard.h"
#include "dawn/fs_util.h"
#include "dawn/link_runner.h"
#include "dawn/project_lock.h"
#include "dawn/sandbox.h"
#include "dawn/schemas.h"
#include "dawn/shadow.h"
#include "dawn/yaml_json.h"

#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace dawn {

namespace {

constexpr const char* kBundleArtifact = "dawn.project.bundle";
constexpr const char* kRunSummaryArtifact = "dawn.metrics.run_summary";
constexpr const char* kMetricsLink = "package.metrics";
constexpr const char* kPreflight = "__preflight__";

// Always writable by any link, besides its own output directory.
const char* const kSharedPrefixes[] = {"ledger", "runs", "healing", "inputs"};

int64_t ms_since(std::chrono::steady_clock::time_point t0) {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

bool valid_project_id(const std::string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

bool file_exists(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

std::string fmt_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

std::string bracket_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += ", ";
        out += items[i];
    }
    return out + "]";
}

void put_if_absent(json_object* o, const char* key, const std::string& v) {
    if (!json_mini::get(o, key)) json_mini::put_string(o, key, v);
}

// True when p lies inside dir (both compared lexically).
bool is_within(const std::filesystem::path& p, const std::filesystem::path& dir) {
    auto rel = p.lexically_normal().lexically_relative(dir.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

Orchestrator::Orchestrator(const PolicyLoader& policy,
                           const LinkRegistry& registry,
                           const LinkTable& links,
                           std::filesystem::path projects_dir,
                           OrchestratorOptions opts)
    : policy_(policy),
      registry_(registry),
      links_(links),
      projects_dir_(std::move(projects_dir)),
      profile_(opts.profile.empty() ? policy.default_profile() : opts.profile),
      worker_id_(opts.worker_id.empty() ? worker_identity() : opts.worker_id),
      ledger_fsync_(opts.ledger_fsync),
      scorer_(opts.scorer ? opts.scorer : std::make_shared<StructuralCoherenceScorer>()) {
    (void)policy_.get_profile(profile_);

    std::error_code ec;
    std::filesystem::create_directories(projects_dir_, ec);
    if (ec) throw std::runtime_error("cannot create projects dir " + projects_dir_.string() + ": " + ec.message());
}

std::filesystem::path Orchestrator::project_root(const std::string& project_id) const {
    return std::filesystem::absolute(projects_dir_ / project_id).lexically_normal();
}

// ---------- preparation (before the lock, before anything runs) ----------

Orchestrator::PreparedLink Orchestrator::prepare_link(const PipelineSpec& spec, const PipelineEntry* entry,
                                                      const std::string& id) const {
    const LinkEntry* le = registry_.getLink(id);
    if (!le) throw PipelineError("Link " + id + " not found in registry");
    const LinkFn* fn = links_.find(id);
    if (!fn) throw PipelineError("Link " + id + " has a manifest but no registered implementation");

    PreparedLink p;
    p.id = id;
    p.fn = fn;
    p.manifest = json_mini::Doc(json_mini::clone(le->manifest->root));

    if (json_object* o = spec.overrides_for(id)) json_mini::deep_merge(p.manifest.root, o);

    json_object* cfg = json_mini::get(p.manifest.root, "config");
    if (!json_mini::is_object(cfg)) {
        cfg = json_object_new_object();
        json_mini::put(p.manifest.root, "config", cfg);
    }
    if (entry && entry->config) json_mini::deep_merge(cfg, entry->config->root);
    if (entry && entry->overrides) json_mini::deep_merge(p.manifest.root, entry->overrides->root);

    p.contract = parse_link_contract(p.manifest.root);
    p.contract.id = id;
    return p;
}

std::vector<Orchestrator::PreparedEntry> Orchestrator::prepare(const PipelineSpec& spec) const {
    std::vector<PreparedEntry> out;
    out.reserve(spec.links.size());
    for (const auto& e : spec.links) {
        PreparedEntry pe;
        pe.link = prepare_link(spec, &e, e.id);
        if (e.shadow) {
            if (e.shadow->link == e.id) throw PipelineError("Link " + e.id + " cannot shadow itself");
            pe.shadow = prepare_link(spec, nullptr, e.shadow->link);
            pe.parity_threshold = e.shadow->parity_threshold;
        }
        out.push_back(std::move(pe));
    }
    return out;
}

// ---------- pipeline ----------

ProjectContext Orchestrator::runPipeline(const std::string& project_id, const std::filesystem::path& pipeline_path,
                                         const std::string& profile) {
    PipelineSpec spec = load_pipeline_spec(pipeline_path);
    return runPipeline(project_id, spec, profile);
}

ProjectContext Orchestrator::runPipeline(const std::string& project_id, const PipelineSpec& spec,
                                         const std::string& profile) {
    if (!valid_project_id(project_id)) throw PipelineError("invalid project id '" + project_id + "'");
    const std::string active = profile.empty() ? profile_ : profile;
    (void)policy_.get_profile(active);

    auto entries = prepare(spec);

    const auto root = project_root(project_id);
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) throw std::runtime_error("cannot create project dir " + root.string() + ": " + ec.message());

    auto t0 = std::chrono::steady_clock::now();
    ProjectLock lock(root);
    return runLocked(project_id, spec, entries, active, ms_since(t0));
}

ProjectContext Orchestrator::runLocked(const std::string& project_id, const PipelineSpec& spec,
                                       std::vector<PreparedEntry>& entries, const std::string& profile,
                                       int64_t lock_wait_ms) {
    ProjectContext ctx;
    ctx.project_id = project_id;
    ctx.pipeline_id = spec.pipeline_id;
    ctx.pipeline_run_id = uuid4();
    ctx.worker_id = worker_id_;
    ctx.profile = profile;
    ctx.project_root = project_root(project_id);
    ctx.link_durations = json_mini::new_object();
    ctx.budget_violations = json_mini::new_array();
    ctx.lock_wait_time_ms = lock_wait_ms;

    const double started_at = epoch_now();
    const auto t0 = std::chrono::steady_clock::now();

    Ledger ledger(ctx.project_root);
    ledger.set_fsync(ledger_fsync_);
    ArtifactStore store(ctx.project_root);
    RunHandles h{ledger, store, spec};

    log_line(LogLevel::INFO, "Starting pipeline " + ctx.pipeline_id + " for project " + project_id +
                                 " [profile=" + profile + "]");

    checkProjectSize(ctx, ledger);

    // Prior outputs stay usable: reload the index and re-verify each
    // producer's manifest against the files on disk.
    ctx.artifact_index = load_artifact_index(ctx.project_root);
    {
        std::set<std::string> producers;
        json_object_object_foreach(ctx.artifact_index.root, aid, entry) {
            (void)aid;
            auto producer = json_mini::get_string(entry, "link_id");
            if (producer && *producer != kMetricsLink) producers.insert(*producer);
        }
        for (const auto& p : producers) store.rehydrate_from_link_dir(p);
    }

    ShadowState shadows(ctx.project_root);
    shadows.load();

    for (auto& pe : entries) {
        const ShadowMaturity* m = pe.shadow ? shadows.find(pe.link.id) : nullptr;
        const bool promoted = m && m->approved && m->shadow == pe.shadow->id;
        const PreparedLink& link = promoted ? *pe.shadow : pe.link;

        auto set_status = [&](const std::string& s) {
            ctx.status_index[link.id] = s;
            if (promoted) ctx.status_index[pe.link.id] = s;
        };

        if (promoted) {
            LedgerEvent ev = make_event(ctx, pe.link.id, "", "shadow_promoted", "SUCCEEDED");
            ev.metrics = run_metrics(ctx);
            json_mini::put_string(ev.metrics.root, "stable", pe.link.id);
            json_mini::put_string(ev.metrics.root, "shadow", link.id);
            json_mini::put_string(ev.metrics.root, "approved_by", m->approved_by);
            ledger.log_event(ev);
            log_line(LogLevel::INFO, "Link " + pe.link.id + " replaced by promoted shadow " + link.id);
        }

        if (!evaluateCondition(ctx, link.contract.when)) {
            const std::string cond = link.contract.when.to_string();
            log_line(LogLevel::INFO, "Skipping link " + link.id + " due to condition: " + cond);
            for (const char* step : {"evaluate_condition", "link_complete"}) {
                LedgerEvent ev = make_event(ctx, link.id, "", step, "SKIPPED", link.contract.contract_version);
                ev.metrics = run_metrics(ctx);
                json_mini::put_string(ev.metrics.root, "condition", cond);
                ledger.log_event(ev);
            }
            set_status("SKIPPED");
            json_object* d = json_object_new_object();
            json_mini::put_int(d, "duration_ms", 0);
            json_mini::put_bool(d, "skipped", true);
            json_mini::put_string(d, "reason", cond);
            json_mini::put(ctx.link_durations.root, link.id.c_str(), d);
            continue;
        }

        const auto lt0 = std::chrono::steady_clock::now();
        auto record_failure = [&](ErrorKind kind, const std::string& msg, bool logged, json_object* context) {
            log_line(LogLevel::ERROR, "Error executing link " + link.id + ": " + msg);
            if (!logged) {
                LedgerEvent ev = make_event(ctx, link.id, "", "link_failed", "FAILED", link.contract.contract_version);
                ev.errors = json_mini::Doc(context ? json_mini::clone(context) : json_object_new_object());
                put_if_absent(ev.errors.root, "type", error_kind_name(kind));
                put_if_absent(ev.errors.root, "message", msg);
                put_if_absent(ev.errors.root, "step_id", "run");
                ev.metrics = run_metrics(ctx);
                try {
                    ledger.log_event(ev);
                } catch (const std::exception& le) {
                    log_line(LogLevel::ERROR, "cannot record failure of " + link.id + ": " + le.what());
                }
            }
            set_status("FAILED");
            json_object* d = json_object_new_object();
            json_mini::put_int(d, "duration_ms", ms_since(lt0));
            json_mini::put_bool(d, "skipped", false);
            json_mini::put_string(d, "error", msg);
            json_mini::put_string(d, "type", error_kind_name(kind));
            json_mini::put(ctx.link_durations.root, link.id.c_str(), d);

            ctx.failed = true;
            ctx.failure_link = link.id;
            ctx.failure_error = msg;
            ctx.failure_kind = kind;
        };

        try {
            LinkRun r = executeLink(ctx, h, link);
            const bool reused = r.status == "SKIPPED";
            set_status(r.status);
            if (reused) {
                ctx.reused_links.insert(link.id);
                if (promoted) ctx.reused_links.insert(pe.link.id);
            }
            json_object* d = json_object_new_object();
            json_mini::put_int(d, "duration_ms", ms_since(lt0));
            json_mini::put_bool(d, "skipped", reused);
            if (reused) json_mini::put_string(d, "reason", "ALREADY_DONE");
            if (r.metrics) json_mini::put(d, "metrics", r.metrics.release());
            json_mini::put(ctx.link_durations.root, link.id.c_str(), d);
        } catch (const LinkFailure& e) {
            record_failure(e.kind(), e.what(), e.logged(), e.context());
        } catch (const std::exception& e) {
            record_failure(ErrorKind::RUNTIME_ERROR, e.what(), false, nullptr);
        }
        if (ctx.failed) break;

        if (pe.shadow && !promoted) runShadow(ctx, h, pe.link, *pe.shadow, pe.parity_threshold);
    }

    const double ended_at = epoch_now();
    const int64_t duration_ms = ms_since(t0);

    // Persisted whether the run succeeded or not.
    std::vector<std::string> persist_errors;
    std::string err = writeRunSummary(ctx, spec, started_at, ended_at, duration_ms);
    if (!err.empty()) persist_errors.push_back("run summary: " + err);
    err = save_artifact_index(ctx.project_root, ctx.artifact_index.root);
    if (!err.empty()) persist_errors.push_back("artifact index: " + err);
    if (spec.document) {
        err = write_atomic(ctx.project_root / "pipeline.yaml", json_to_yaml(spec.document->root));
        if (!err.empty()) persist_errors.push_back("pipeline.yaml: " + err);
    }
    for (const auto& e : persist_errors) log_line(LogLevel::ERROR, "cannot persist " + e);

    if (ctx.failed) throw PipelineRunError(ctx.failure_link, ctx.failure_kind, ctx.failure_error);
    if (!persist_errors.empty()) {
        throw std::runtime_error("pipeline " + ctx.pipeline_id + " finished but state was not persisted: " +
                                 persist_errors.front());
    }

    log_line(LogLevel::INFO, "Pipeline " + ctx.pipeline_id + " completed for project " + project_id + " in " +
                                 std::to_string(duration_ms) + " ms");
    return ctx;
}

void Orchestrator::checkProjectSize(ProjectContext& ctx, Ledger& ledger) {
    auto limit = policy_.get_budget("per_project", "max_project_bytes");
    if (!limit || *limit <= 0) return;

    const uint64_t total = dir_size_bytes(ctx.project_root);
    if (total <= (uint64_t)*limit) return;

    const std::string msg = "BUDGET_PROJECT_LIMIT: Project size " + std::to_string(total) +
                            " bytes exceeds limit of " + std::to_string(*limit) + " bytes";
    LedgerEvent ev = make_event(ctx, kPreflight, ctx.pipeline_run_id, "budget_check", "FAILED");
    ev.errors = json_mini::new_object();
    json_mini::put_string(ev.errors.root, "type", error_kind_name(ErrorKind::BUDGET_PROJECT_LIMIT));
    json_mini::put_string(ev.errors.root, "message", msg);
    json_mini::put_int(ev.errors.root, "measured_bytes", (int64_t)total);
    json_mini::put_int(ev.errors.root, "limit_bytes", *limit);
    ev.metrics = run_metrics(ctx);
    ledger.log_event(ev);

    log_line(LogLevel::ERROR, msg);
    throw PipelineRunError(kPreflight, ErrorKind::BUDGET_PROJECT_LIMIT, msg);
}

bool Orchestrator::evaluateCondition(const ProjectContext& ctx, const WhenCondition& when) const {
    auto status_of = [&](const std::string& id) {
        auto it = ctx.status_index.find(id);
        return it == ctx.status_index.end() ? std::string() : it->second;
    };
    switch (when.kind) {
        case WhenCondition::Kind::ALWAYS:
            return true;
        case WhenCondition::Kind::ON_SUCCESS:
            return status_of(when.target) == "SUCCEEDED" || ctx.reused_links.count(when.target) != 0;
        case WhenCondition::Kind::ON_FAILURE:
            return status_of(when.target) == "FAILED";
        case WhenCondition::Kind::IF_ARTIFACT_EXISTS:
            return json_mini::get(ctx.artifact_index.root, when.target.c_str()) != nullptr;
    }
    return true;
}

std::string Orchestrator::inputSignature(const ProjectContext& ctx, const ArtifactStore& store,
                                         const PreparedLink& link) const {
    json_object* cfg = json_mini::get(link.manifest.root, "config");
    const std::string cfg_json = cfg ? json_mini::canonical(cfg) : "{}";

    std::string sig = "link=" + link.id + "|cfg=" + sha256_hex(cfg_json).substr(0, 16);

    // Only a bundle whose producer already settled in this run counts. The
    // store also holds outputs rehydrated from the previous run, and those
    // are absent when the previous run computed its signatures.
    const ArtifactRecord* bundle = store.get(kBundleArtifact);
    bool settled = false;
    if (bundle) {
        auto st = ctx.status_index.find(bundle->producer_link_id);
        settled = (st != ctx.status_index.end() && st->second == "SUCCEEDED") ||
                  ctx.reused_links.count(bundle->producer_link_id) != 0;
    }
    if (settled) {
        auto doc = json_mini::parse_file(bundle->path);
        auto sha = json_mini::get_string(doc.root, "bundle_sha256");
        if (sha && !sha->empty()) sig += "|bundle=" + *sha;
    }
    return sha256_hex(sig).substr(0, 32);
}

// ---------- one link ----------

LinkContext Orchestrator::link_context(const ProjectContext& ctx, const ArtifactStore& store,
                                       const PreparedLink& link, ILinkSandbox* sandbox,
                                       const std::string& link_run_id) const {
    LinkContext lc;
    lc.project_id = ctx.project_id;
    lc.pipeline_id = ctx.pipeline_id;
    lc.pipeline_run_id = ctx.pipeline_run_id;
    lc.link_run_id = link_run_id;
    lc.link_id = link.id;
    lc.worker_id = ctx.worker_id;
    lc.profile = ctx.profile;
    lc.project_root = ctx.project_root;
    lc.config = json_mini::get(link.manifest.root, "config");

    json_object_object_foreach(ctx.artifact_index.root, aid, entry) {
        auto p = json_mini::get_string(entry, "path");
        if (p) lc.artifacts[aid] = *p;
    }
    for (const auto& aid : store.list_artifacts()) lc.artifacts[aid] = store.get(aid)->path;

    lc.allowed_subprocess_commands = policy_.allowed_subprocess_commands(ctx.profile);
    lc.sandbox = sandbox;
    lc.policy = &policy_;
    return lc;
}

int Orchestrator::link_timeout(const ProjectContext& ctx, const PreparedLink& link) const {
    int t = link.contract.runtime.max_wall_time_sec.value_or(0);
    return t > 0 ? t : policy_.effective_timeout(ctx.profile);
}

Orchestrator::LinkRun Orchestrator::executeLink(ProjectContext& ctx, RunHandles& h, const PreparedLink& link) {
    const std::string link_run_id = uuid4();
    const std::string& cv = link.contract.contract_version;
    const std::string sig = inputSignature(ctx, h.store, link);

    if (!link.contract.runtime.always_run) {
        auto last = h.ledger.last_link_complete(link.id);
        if (last && json_mini::get_string(last.root, "status").value_or("") == "SUCCEEDED" &&
            json_mini::get_string(json_mini::get(last.root, "metrics"), "input_signature").value_or("") == sig) {
            const int rehydrated = h.store.rehydrate_from_link_dir(link.id);

            std::vector<std::string> required;
            for (const auto& p : link.contract.produces) {
                if (!p.optional) required.push_back(p.artifact_id);
            }
            if (!required.empty() && rehydrated == 0) {
                throw fail_logged(ctx, h, link, link_run_id, "validate_skip", ErrorKind::REHYDRATION_FAILED,
                                  "Link " + link.id + " marked ALREADY_DONE but no artifacts rehydrated. "
                                  "Expected artifacts from contract: " + bracket_list(required) +
                                  ". The artifact manifest is missing or corrupted.");
            }

            for (const auto& rec : h.store.records_for_link(link.id)) {
                json_object* prev = json_mini::get(ctx.artifact_index.root, rec.artifact_id.c_str());
                if (!prev || json_mini::get_string(prev, "digest").value_or("") != rec.digest) {
                    json_mini::put(ctx.artifact_index.root, rec.artifact_id.c_str(),
                                   index_entry(rec, ctx.pipeline_run_id).release());
                }
            }

            LedgerEvent ev = make_event(ctx, link.id, link_run_id, "skip", "SKIPPED", cv);
            ev.metrics = run_metrics(ctx);
            json_mini::put_string(ev.metrics.root, "reason", "ALREADY_DONE");
            json_mini::put_int(ev.metrics.root, "rehydrated_artifacts", rehydrated);
            json_mini::put_string(ev.metrics.root, "input_signature", sig);
            h.ledger.log_event(ev);
            log_line(LogLevel::INFO, "Skipping link " + link.id + ": ALREADY_DONE with matching signature");

            LinkRun r;
            r.status = "SKIPPED";
            return r;
        }
    }

    // A re-execution supersedes whatever this link produced before.
    h.store.forget_link(link.id);

    {
        LedgerEvent ev = make_event(ctx, link.id, link_run_id, "link_start", "STARTED", cv);
        ev.metrics = run_metrics(ctx);
        json_mini::put_string(ev.metrics.root, "input_signature", sig);
        h.ledger.log_event(ev);
    }
    log_line(LogLevel::INFO, "Executing link: " + link.id);

    try {
        validateInputs(ctx, h, link, link_run_id);

        Sandbox sandbox(h.store.artifacts_dir(), link.id, &h.store);
        LinkContext lc = link_context(ctx, h.store, link, &sandbox, link_run_id);
        const int timeout_sec = link_timeout(ctx, link);

        const FsSnapshot pre = snapshot_tree(ctx.project_root);
        LinkRunOutcome out = run_link_isolated(*link.fn, lc, sandbox, timeout_sec);

        if (out.timed_out) {
            const std::string msg = "BUDGET_TIMEOUT: Link " + link.id + " exceeded wall time limit of " +
                                    std::to_string(timeout_sec) + "s";
            json_object* v = json_object_new_object();
            json_mini::put_string(v, "link_id", link.id);
            json_mini::put_string(v, "type", error_kind_name(ErrorKind::BUDGET_TIMEOUT));
            json_mini::put_string(v, "message", msg);
            json_mini::put_int(v, "timeout_sec", timeout_sec);
            json_object_array_add(ctx.budget_violations.root, v);

            auto extra = json_mini::new_object();
            json_mini::put_int(extra.root, "timeout_sec", timeout_sec);
            throw fail_logged(ctx, h, link, link_run_id, "link_complete", ErrorKind::BUDGET_TIMEOUT, msg,
                              std::move(extra));
        }
        if (!out.exception.empty()) throw std::runtime_error(out.exception);
        if (!out.error.empty()) throw std::runtime_error(out.error);

        // Sandbox scan. Runs even when the link reports success.
        const FsSnapshot post = snapshot_tree(ctx.project_root);
        PathPrefixSet allowed;
        allowed.add("artifacts/" + link.id);
        for (const char* p : kSharedPrefixes) allowed.add(p);
        if (policy_.get_profile(ctx.profile).allow_src_writes && policy_.is_src_write_allowed(link.id, ctx.profile)) {
            allowed.add("src");
        }
        const auto leaks = find_leaks(pre, post, allowed);
        if (!leaks.empty()) {
            auto extra = json_mini::new_object();
            json_mini::put(extra.root, "leaked_paths", json_mini::string_array(leaks));
            throw fail_logged(ctx, h, link, link_run_id, "sandbox_check", ErrorKind::POLICY_VIOLATION,
                              "POLICY_VIOLATION: Link " + link.id +
                                  " modified files outside allowed sandbox roots: " + bracket_list(leaks),
                              std::move(extra));
        }

        if (auto limit = policy_.get_budget("per_link", "max_output_bytes"); limit && *limit > 0) {
            const uint64_t used = dir_size_bytes(sandbox.root());
            if (used > (uint64_t)*limit) {
                const std::string msg = "BUDGET_OUTPUT_LIMIT: Link " + link.id + " output size " +
                                        std::to_string(used) + " bytes exceeds limit of " +
                                        std::to_string(*limit) + " bytes";
                json_object* v = json_object_new_object();
                json_mini::put_string(v, "link_id", link.id);
                json_mini::put_string(v, "type", error_kind_name(ErrorKind::BUDGET_OUTPUT_LIMIT));
                json_mini::put_int(v, "measured_bytes", (int64_t)used);
                json_mini::put_int(v, "limit_bytes", *limit);
                json_object_array_add(ctx.budget_violations.root, v);

                auto extra = json_mini::new_object();
                json_mini::put_int(extra.root, "measured_bytes", (int64_t)used);
                json_mini::put_int(extra.root, "limit_bytes", *limit);
                throw fail_logged(ctx, h, link, link_run_id, "budget_check", ErrorKind::BUDGET_OUTPUT_LIMIT, msg,
                                  std::move(extra));
            }
        }

        // Published records come back from the child; digests are recomputed here.
        for (const auto& p : out.published) {
            if (!is_within(p.path, sandbox.root())) {
                throw fail_logged(ctx, h, link, link_run_id, "validate_outputs", ErrorKind::POLICY_VIOLATION,
                                  "POLICY_VIOLATION: Link " + link.id + " published " + p.artifact_id +
                                      " outside its sandbox: " + p.path.string());
            }
            if (!file_exists(p.path)) {
                throw fail_logged(ctx, h, link, link_run_id, "validate_outputs",
                                  ErrorKind::PRODUCED_ARTIFACT_MISSING,
                                  "PRODUCED_ARTIFACT_MISSING: " + p.artifact_id + " published but file missing: " +
                                      p.path.string());
            }
            h.store.register_artifact(p.artifact_id, p.path, p.schema, link.id);
        }

        if (out.result.status == "FAILED") {
            json_mini::Doc errors(out.result.errors ? json_mini::clone(out.result.errors.root)
                                                    : json_object_new_object());
            put_if_absent(errors.root, "type", error_kind_name(ErrorKind::RUNTIME_ERROR));
            put_if_absent(errors.root, "step_id", "run");
            const std::string type = json_mini::get_string(errors.root, "type").value_or("");
            const ErrorKind kind = error_kind_from_name(type).value_or(ErrorKind::RUNTIME_ERROR);
            const std::string reason = json_mini::get_string(errors.root, "message").value_or("No error message");
            throw fail_logged(ctx, h, link, link_run_id, "link_complete", kind,
                              "Link " + link.id + " reported failure: " + reason, std::move(errors));
        }

        json_mini::Doc outputs = validateOutputs(ctx, h, link, link_run_id);
        checkCoherence(ctx, h, link, link_run_id, outputs.root);

        std::string err = h.store.save_manifest(link.id);
        if (!err.empty()) throw std::runtime_error("cannot save artifact manifest for " + link.id + ": " + err);

        json_object_object_foreach(outputs.root, aid, entry) {
            json_mini::put(ctx.artifact_index.root, aid, json_mini::clone(entry));
        }

        json_mini::Doc metrics(out.result.metrics ? json_mini::clone(out.result.metrics.root)
                                                  : json_object_new_object());
        json_mini::put_string(metrics.root, "input_signature", sig);
        json_mini::put_string(metrics.root, "run_id", ctx.pipeline_run_id);
        json_mini::put_string(metrics.root, "worker_id", ctx.worker_id);
        json_mini::put_double(metrics.root, "cpu_sec", out.cpu_sec);
        json_mini::put_double(metrics.root, "mem_mb_peak", out.mem_mb_peak);

        LedgerEvent ev = make_event(ctx, link.id, link_run_id, "link_complete", "SUCCEEDED", cv);
        ev.outputs = json_mini::Doc(json_mini::clone(outputs.root));
        ev.metrics = json_mini::Doc(json_mini::clone(metrics.root));
        ev.errors = json_mini::Doc(out.result.errors ? json_mini::clone(out.result.errors.root)
                                                     : json_object_new_object());
        h.ledger.log_event(ev);

        LinkRun r;
        r.status = "SUCCEEDED";
        r.metrics = std::move(metrics);
        return r;
    } catch (LinkFailure& e) {
        if (!e.logged()) {
            LedgerEvent ev = make_event(ctx, link.id, link_run_id, "link_failed", "FAILED", cv);
            ev.errors = json_mini::Doc(json_mini::clone(e.context()));
            put_if_absent(ev.errors.root, "step_id", "run");
            ev.metrics = run_metrics(ctx);
            h.ledger.log_event(ev);
            e.mark_logged();
        }
        throw;
    } catch (const std::exception& e) {
        auto errors = json_mini::new_object();
        json_mini::put_string(errors.root, "type", error_kind_name(ErrorKind::RUNTIME_ERROR));
        json_mini::put_string(errors.root, "message", e.what());
        json_mini::put_string(errors.root, "step_id", "run");

        LedgerEvent ev = make_event(ctx, link.id, link_run_id, "link_failed", "FAILED", cv);
        ev.errors = json_mini::Doc(json_mini::clone(errors.root));
        ev.metrics = run_metrics(ctx);
        h.ledger.log_event(ev);

        LinkFailure f(ErrorKind::RUNTIME_ERROR, e.what(), std::move(errors));
        f.mark_logged();
        throw f;
    }
}

void Orchestrator::validateInputs(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                                  const std::string& link_run_id) {
    for (const auto& req : link.contract.requires_) {
        if (req.artifact_id.empty()) continue;

        if (const ArtifactRecord* rec = h.store.get(req.artifact_id)) {
            if (!file_exists(rec->path)) {
                throw fail_logged(ctx, h, link, link_run_id, "validate_inputs",
                                  ErrorKind::MISSING_REQUIRED_ARTIFACT,
                                  "Artifact " + req.artifact_id + " registered but file missing: " +
                                      rec->path.string());
            }
            continue;
        }
        if (json_object* idx = json_mini::get(ctx.artifact_index.root, req.artifact_id.c_str())) {
            auto p = json_mini::get_string(idx, "path");
            if (p && file_exists(*p)) continue;
        }
        if (req.optional) continue;

        std::string msg = "MISSING_REQUIRED_ARTIFACT: " + req.artifact_id;
        if (!req.from_link.empty()) msg += " (expected from " + req.from_link + ")";
        auto extra = json_mini::new_object();
        json_mini::put_string(extra.root, "artifact_id", req.artifact_id);
        throw fail_logged(ctx, h, link, link_run_id, "validate_inputs", ErrorKind::MISSING_REQUIRED_ARTIFACT, msg,
                          std::move(extra));
    }
}

json_mini::Doc Orchestrator::validateOutputs(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                                             const std::string& link_run_id) {
    auto outputs = json_mini::new_object();

    for (const auto& prod : link.contract.produces) {
        const std::string& aid = prod.artifact_id;
        if (aid.empty()) continue;

        const ArtifactRecord* rec = h.store.get(aid);
        if (rec && rec->producer_link_id != link.id) rec = nullptr;

        if (!rec && !prod.path.empty()) {
            auto file = h.store.artifacts_dir() / link.id / prod.path;
            if (file_exists(file)) rec = &h.store.register_artifact(aid, file, prod.schema_type, link.id);
        }

        if (!rec) {
            if (prod.optional) continue;
            auto extra = json_mini::new_object();
            json_mini::put_string(extra.root, "artifact_id", aid);
            const std::string msg = prod.path.empty()
                ? "PRODUCED_ARTIFACT_MISSING: " + aid + ". Link " + link.id + " did not publish '" + aid +
                      "' and no path was provided in contract."
                : "PRODUCED_ARTIFACT_MISSING: " + aid + " at " + prod.path;
            throw fail_logged(ctx, h, link, link_run_id, "validate_outputs", ErrorKind::PRODUCED_ARTIFACT_MISSING,
                              msg, std::move(extra));
        }
        if (!file_exists(rec->path)) {
            throw fail_logged(ctx, h, link, link_run_id, "validate_outputs", ErrorKind::PRODUCED_ARTIFACT_MISSING,
                              "Artifact " + aid + " registered but file missing: " + rec->path.string());
        }

        const bool is_json = prod.schema_type == "json" || (prod.schema_type.empty() && rec->schema == "json");
        if (is_json || !prod.schema_ref.empty()) {
            const std::string body = slurp(rec->path);
            if (!json_mini::is_valid(body)) {
                throw fail_logged(ctx, h, link, link_run_id, "validate_outputs", ErrorKind::SCHEMA_INVALID,
                                  "SCHEMA_INVALID: " + aid + " is not valid JSON");
            }
            if (!prod.schema_ref.empty()) {
                if (!schemas::is_known(prod.schema_ref)) {
                    log_line(LogLevel::WARN, "Link " + link.id + ": unknown schema '" + prod.schema_ref +
                                                 "' for " + aid + ", structural check skipped");
                } else {
                    auto doc = json_mini::parse(body);
                    const std::string verr = schemas::validate(prod.schema_ref, doc.root);
                    if (!verr.empty()) {
                        auto extra = json_mini::new_object();
                        json_mini::put_string(extra.root, "schema_ref", prod.schema_ref);
                        throw fail_logged(ctx, h, link, link_run_id, "validate_outputs", ErrorKind::SCHEMA_INVALID,
                                          "SCHEMA_INVALID: " + aid + " failed validation against '" +
                                              prod.schema_ref + "': " + verr,
                                          std::move(extra));
                    }
                }
            }
        }

        json_mini::put(outputs.root, aid.c_str(), index_entry(*rec, ctx.pipeline_run_id).release());
    }

    // Published beyond the declared produces.
    for (const auto& rec : h.store.records_for_link(link.id)) {
        if (!json_mini::get(outputs.root, rec.artifact_id.c_str())) {
            json_mini::put(outputs.root, rec.artifact_id.c_str(), index_entry(rec, ctx.pipeline_run_id).release());
        }
    }
    return outputs;
}

void Orchestrator::checkCoherence(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                                  const std::string& link_run_id, json_object* outputs) {
    if (!link.contract.coherence) return;
    const CoherencePolicy& cp = *link.contract.coherence;
    const std::string& cv = link.contract.contract_version;

    std::string target = cp.artifact;
    if (target.empty()) {
        for (const auto& p : link.contract.produces) {
            if (p.schema_type == "json") {
                target = p.artifact_id;
                break;
            }
        }
    }
    const ArtifactRecord* cur = target.empty() ? nullptr : h.store.get(target);
    const ArtifactRecord* base = h.store.get(cp.baseline);

    if (!cur || !base || cur == base) {
        LedgerEvent ev = make_event(ctx, link.id, link_run_id, "coherence_check", "SKIPPED", cv);
        ev.metrics = run_metrics(ctx);
        json_mini::put_string(ev.metrics.root, "reason", !cur ? "no artifact to score" : "baseline unavailable");
        json_mini::put_string(ev.metrics.root, "artifact", target);
        json_mini::put_string(ev.metrics.root, "baseline", cp.baseline);
        h.ledger.log_event(ev);
        return;
    }

    auto cur_doc = json_mini::parse_file(cur->path);
    auto base_doc = json_mini::parse_file(base->path);
    const CoherenceScore s = scorer_->score(cur_doc.root, base_doc.root);

    if (s.score >= cp.threshold) {
        LedgerEvent ev = make_event(ctx, link.id, link_run_id, "coherence_check", "SUCCEEDED", cv);
        ev.drift_score = s.score;
        ev.metrics = run_metrics(ctx);
        json_mini::put_double(ev.metrics.root, "threshold", cp.threshold);
        json_mini::put_string(ev.metrics.root, "evidence", s.evidence);
        json_mini::put_string(ev.metrics.root, "scorer", scorer_->name());
        h.ledger.log_event(ev);
        return;
    }

    auto meta = json_mini::new_object();
    json_mini::put_double(meta.root, "threshold", cp.threshold);
    json_mini::put_string(meta.root, "evidence", s.evidence);
    json_mini::put_string(meta.root, "on_drift", on_drift_name(cp.on_drift));
    json_mini::put_string(meta.root, "artifact", target);
    json_mini::put_string(meta.root, "artifact_digest", cur->digest);
    json_mini::put_string(meta.root, "baseline", cp.baseline);
    json_mini::put_string(meta.root, "baseline_digest", base->digest);
    json_mini::put_string(meta.root, "scorer", scorer_->name());

    {
        LedgerEvent ev = make_event(ctx, link.id, link_run_id, "coherence_check", "DRIFT_DETECTED", cv);
        ev.drift_score = s.score;
        ev.drift_metadata = json_mini::Doc(json_mini::clone(meta.root));
        ev.metrics = run_metrics(ctx);
        h.ledger.log_event(ev);
    }

    const std::string msg = "COHERENCE_DRIFT: Link " + link.id + " scored " + fmt_score(s.score) +
                            " against " + cp.baseline + " (threshold " + fmt_score(cp.threshold) + ")";

    switch (cp.on_drift) {
        case CoherencePolicy::OnDrift::FAIL: {
            auto extra = json_mini::new_object();
            json_mini::put_double(extra.root, "drift_score", s.score);
            json_mini::put_double(extra.root, "threshold", cp.threshold);
            json_mini::put_string(extra.root, "evidence", s.evidence);
            throw fail_logged(ctx, h, link, link_run_id, "link_complete", ErrorKind::COHERENCE_DRIFT, msg,
                              std::move(extra));
        }
        case CoherencePolicy::OnDrift::WARN:
            log_line(LogLevel::WARN, msg + ": " + s.evidence);
            return;
        case CoherencePolicy::OnDrift::REFLECT:
            break;
    }

    // Reflection: the drift evidence becomes an artifact of its own.
    const auto path = ctx.project_root / "healing" / link.id / ("drift_" + ctx.pipeline_run_id + ".json");
    json_mini::Doc report(json_mini::clone(meta.root));
    json_mini::put_string(report.root, "link_id", link.id);
    json_mini::put_string(report.root, "run_id", ctx.pipeline_run_id);
    json_mini::put_double(report.root, "drift_score", s.score);
    json_mini::put_string(report.root, "created_at", iso_utc_now());
    std::string err = write_atomic(path, json_mini::serialize_sorted(report.root, 2) + "\n");
    if (!err.empty()) throw std::runtime_error("cannot write drift report: " + err);

    const ArtifactRecord& rec = h.store.register_artifact(link.id + ".drift_report", path, "json", link.id);
    json_mini::Doc entry = index_entry(rec, ctx.pipeline_run_id);
    json_mini::put(outputs, rec.artifact_id.c_str(), json_mini::clone(entry.root));

    LedgerEvent ev = make_event(ctx, link.id, link_run_id, "reflect", "SUCCEEDED", cv);
    ev.drift_score = s.score;
    ev.outputs = json_mini::new_object();
    json_mini::put(ev.outputs.root, rec.artifact_id.c_str(), entry.release());
    ev.metrics = run_metrics(ctx);
    h.ledger.log_event(ev);
    log_line(LogLevel::WARN, msg + "; drift evidence saved to " + path.string());
}

// ---------- shadow ----------

void Orchestrator::runShadow(ProjectContext& ctx, RunHandles& h, const PreparedLink& stable,
                             const PreparedLink& shadow, double parity_threshold) {
    ShadowState state(ctx.project_root);
    state.load();
    ShadowMaturity& m = state.entry(stable.id, shadow.id);
    const int window = h.spec.shadow_parity_window;
    const std::string link_run_id = uuid4();
    const std::string& cv = shadow.contract.contract_version;

    auto pair_metrics = [&]() {
        json_mini::Doc d = run_metrics(ctx);
        json_mini::put_string(d.root, "stable", stable.id);
        json_mini::put_string(d.root, "shadow", shadow.id);
        return d;
    };
    auto shadow_failed = [&](ErrorKind kind, const std::string& msg) {
        LedgerEvent ev = make_event(ctx, shadow.id, link_run_id, "shadow_run", "FAILED", cv);
        ev.errors = json_mini::new_object();
        json_mini::put_string(ev.errors.root, "type", error_kind_name(kind));
        json_mini::put_string(ev.errors.root, "message", msg);
        ev.metrics = pair_metrics();
        h.ledger.log_event(ev);
        log_line(LogLevel::WARN, "shadow " + shadow.id + " of " + stable.id + " failed: " + msg);
        state.record_parity(m, 0.0, parity_threshold, window);
    };

    log_line(LogLevel::INFO, "Running shadow " + shadow.id + " for " + stable.id);
    try {
        ArtifactStore shadow_store(ctx.project_root, ShadowState::shadow_root(ctx.project_root));
        Sandbox sandbox(shadow_store.artifacts_dir(), shadow.id, &shadow_store);
        LinkContext lc = link_context(ctx, h.store, shadow, &sandbox, link_run_id);
        const int timeout_sec = link_timeout(ctx, shadow);

        const FsSnapshot pre = snapshot_tree(ctx.project_root);
        LinkRunOutcome out = run_link_isolated(*shadow.fn, lc, sandbox, timeout_sec);
        const FsSnapshot post = snapshot_tree(ctx.project_root);

        PathPrefixSet allowed;
        allowed.add("shadow/" + shadow.id);
        for (const char* p : kSharedPrefixes) allowed.add(p);
        const auto leaks = find_leaks(pre, post, allowed);

        if (out.timed_out) {
            shadow_failed(ErrorKind::BUDGET_TIMEOUT, "shadow exceeded wall time limit of " +
                                                         std::to_string(timeout_sec) + "s");
        } else if (!out.exception.empty() || !out.error.empty()) {
            shadow_failed(ErrorKind::RUNTIME_ERROR, out.exception.empty() ? out.error : out.exception);
        } else if (!leaks.empty()) {
            shadow_failed(ErrorKind::POLICY_VIOLATION, "shadow modified files outside its root: " + bracket_list(leaks));
        } else if (out.result.status == "FAILED") {
            const std::string type = json_mini::get_string(out.result.errors.root, "type").value_or("");
            shadow_failed(error_kind_from_name(type).value_or(ErrorKind::RUNTIME_ERROR),
                          json_mini::get_string(out.result.errors.root, "message").value_or("No error message"));
        } else {
            for (const auto& p : out.published) {
                if (is_within(p.path, sandbox.root()) && file_exists(p.path)) {
                    shadow_store.register_artifact(p.artifact_id, p.path, p.schema, shadow.id);
                } else {
                    log_line(LogLevel::WARN, "shadow " + shadow.id + ": ignoring published " + p.artifact_id +
                                                 " at " + p.path.string());
                }
            }
            std::string err = shadow_store.save_manifest(shadow.id);
            if (!err.empty()) log_line(LogLevel::WARN, "shadow manifest not saved: " + err);

            const double parity = artifact_parity(h.store.records_for_link(stable.id), shadow_store);
            const bool ready = state.record_parity(m, parity, parity_threshold, window);

            LedgerEvent ev = make_event(ctx, shadow.id, link_run_id, "shadow_run", "SUCCEEDED", cv);
            ev.metrics = pair_metrics();
            json_mini::put_double(ev.metrics.root, "parity", parity);
            json_mini::put_double(ev.metrics.root, "parity_threshold", parity_threshold);
            json_mini::put_int(ev.metrics.root, "consecutive_parity", m.consecutive_parity);
            json_mini::put_int(ev.metrics.root, "window", window);
            json_mini::put_double(ev.metrics.root, "cpu_sec", out.cpu_sec);
            json_mini::put_double(ev.metrics.root, "mem_mb_peak", out.mem_mb_peak);
            h.ledger.log_event(ev);

            if (ready) {
                LedgerEvent rev = make_event(ctx, stable.id, link_run_id, "shadow_promotion_ready", "SUCCEEDED");
                rev.metrics = pair_metrics();
                json_mini::put_int(rev.metrics.root, "consecutive_parity", m.consecutive_parity);
                json_mini::put_int(rev.metrics.root, "window", window);
                json_mini::put_bool(rev.metrics.root, "requires_approval", true);
                h.ledger.log_event(rev);
                log_line(LogLevel::INFO, "shadow " + shadow.id + " is ready to replace " + stable.id +
                                             " (approval required)");
            }
        }
    } catch (const std::exception& e) {
        shadow_failed(ErrorKind::RUNTIME_ERROR, e.what());
    }

    std::string err = state.save();
    if (!err.empty()) log_line(LogLevel::WARN, "cannot save shadow maturity: " + err);
}

void Orchestrator::approveShadowPromotion(const std::string& project_id, const std::string& stable_link,
                                          const std::string& shadow_link, const std::string& approver) {
    if (!valid_project_id(project_id)) throw PipelineError("invalid project id '" + project_id + "'");
    const auto root = project_root(project_id);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) throw PipelineError("unknown project " + project_id);

    ProjectLock lock(root);
    ShadowState state(root);
    state.load();

    const ShadowMaturity* found = state.find(stable_link);
    if (!found || found->shadow != shadow_link) {
        throw PipelineError("no shadow " + shadow_link + " recorded for link " + stable_link +
                            " in project " + project_id);
    }
    if (!found->ready) {
        throw PipelineError("shadow " + shadow_link + " has not reached its parity window (" +
                            std::to_string(found->consecutive_parity) + " consecutive parity runs)");
    }

    ShadowMaturity& m = state.entry(stable_link, shadow_link);
    m.approved = true;
    m.approved_by = approver.empty() ? "unknown" : approver;
    m.approved_at = iso_utc_now();
    std::string err = state.save();
    if (!err.empty()) throw std::runtime_error("cannot save shadow maturity: " + err);

    ProjectContext pc;
    pc.project_id = project_id;
    pc.worker_id = worker_id_;
    pc.profile = profile_;

    Ledger ledger(root);
    ledger.set_fsync(ledger_fsync_);
    LedgerEvent ev = make_event(pc, stable_link, "", "shadow_promotion_approved", "SUCCEEDED");
    ev.metrics = json_mini::new_object();
    json_mini::put_string(ev.metrics.root, "stable", stable_link);
    json_mini::put_string(ev.metrics.root, "shadow", shadow_link);
    json_mini::put_string(ev.metrics.root, "approved_by", m.approved_by);
    json_mini::put_string(ev.metrics.root, "approved_at", m.approved_at);
    json_mini::put_string(ev.metrics.root, "worker_id", worker_id_);
    ledger.log_event(ev);
    log_line(LogLevel::INFO, "Approved promotion of " + shadow_link + " over " + stable_link);
}

// ---------- run summary and event helpers ----------

std::string Orchestrator::writeRunSummary(ProjectContext& ctx, const PipelineSpec& spec, double started_at,
                                          double ended_at, int64_t duration_ms) {
    auto s = json_mini::new_object();
    json_mini::put_string(s.root, "run_id", ctx.pipeline_run_id);
    json_mini::put_string(s.root, "worker_id", ctx.worker_id);
    json_mini::put_string(s.root, "project_id", ctx.project_id);
    json_mini::put_string(s.root, "pipeline_id", ctx.pipeline_id);
    json_mini::put_string(s.root, "pipeline_path", spec.path.string());
    json_mini::put_string(s.root, "pipeline_digest", spec.digest.empty() ? "unknown" : spec.digest);
    json_mini::put_string(s.root, "profile", ctx.profile);

    json_object* pol = json_object_new_object();
    json_mini::put_string(pol, "version", policy_.version());
    json_mini::put_string(pol, "digest", policy_.digest());
    json_mini::put(s.root, "policy", pol);

    json_object* timing = json_object_new_object();
    json_mini::put_double(timing, "started_at", started_at);
    json_mini::put_double(timing, "ended_at", ended_at);
    json_mini::put_int(timing, "duration_ms", duration_ms);
    json_mini::put_int(timing, "lock_wait_time_ms", ctx.lock_wait_time_ms);
    json_mini::put(s.root, "timing", timing);

    json_mini::put(s.root, "links", json_mini::clone(ctx.link_durations.root));
    json_mini::put_string(s.root, "status", ctx.failed ? "FAILED" : "SUCCEEDED");
    if (ctx.failed) {
        json_object* f = json_object_new_object();
        json_mini::put_string(f, "link_id", ctx.failure_link);
        json_mini::put_string(f, "error", ctx.failure_error);
        json_mini::put_string(f, "type", error_kind_name(ctx.failure_kind));
        json_mini::put(s.root, "failure", f);
    } else {
        json_mini::put(s.root, "failure", nullptr);
    }
    json_mini::put(s.root, "budget_violations", json_mini::clone(ctx.budget_violations.root));

    auto budget = [&](const char* section, const char* key) -> json_object* {
        auto v = policy_.get_budget(section, key);
        return v ? json_object_new_int64(*v) : nullptr;
    };
    json_object* enforced = json_object_new_object();
    json_object* per_link = json_object_new_object();
    json_mini::put(per_link, "max_wall_time_sec", budget("per_link", "max_wall_time_sec"));
    json_mini::put(per_link, "max_output_bytes", budget("per_link", "max_output_bytes"));
    json_object* per_project = json_object_new_object();
    json_mini::put(per_project, "max_project_bytes", budget("per_project", "max_project_bytes"));
    json_mini::put(enforced, "per_link", per_link);
    json_mini::put(enforced, "per_project", per_project);
    json_mini::put(s.root, "budgets_enforced", enforced);

    const auto path = ctx.project_root / "artifacts" / kMetricsLink / "run_summary.json";
    std::string err = write_atomic(path, json_mini::serialize_sorted(s.root, 2) + "\n");
    if (!err.empty()) return err;

    auto entry = json_mini::new_object();
    try {
        json_mini::put_string(entry.root, "digest", ArtifactStore::get_digest(path));
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    json_mini::put_string(entry.root, "path", path.string());
    json_mini::put_string(entry.root, "link_id", kMetricsLink);
    json_mini::put_string(entry.root, "run_id", ctx.pipeline_run_id);
    json_mini::put_string(entry.root, "created_at", iso_utc_now());
    json_mini::put(ctx.artifact_index.root, kRunSummaryArtifact, entry.release());
    return "";
}

LedgerEvent Orchestrator::make_event(const ProjectContext& ctx, const std::string& link_id,
                                     const std::string& run_id, const std::string& step_id,
                                     const std::string& status, const std::string& contract_version) const {
    LedgerEvent ev;
    ev.project_id = ctx.project_id;
    ev.pipeline_id = ctx.pipeline_id;
    ev.link_id = link_id;
    ev.run_id = run_id;
    ev.step_id = step_id;
    ev.status = status;
    ev.policy_versions = json_mini::new_object();
    if (!contract_version.empty()) json_mini::put_string(ev.policy_versions.root, "contractVersion", contract_version);
    json_mini::put_string(ev.policy_versions.root, "policyVersion", policy_.version());
    json_mini::put_string(ev.policy_versions.root, "policyDigest", policy_.digest());
    json_mini::put_string(ev.policy_versions.root, "profile", ctx.profile);
    return ev;
}

json_mini::Doc Orchestrator::run_metrics(const ProjectContext& ctx) const {
    auto m = json_mini::new_object();
    json_mini::put_string(m.root, "run_id", ctx.pipeline_run_id);
    json_mini::put_string(m.root, "worker_id", ctx.worker_id);
    return m;
}

LinkFailure Orchestrator::fail_logged(ProjectContext& ctx, RunHandles& h, const PreparedLink& link,
                                      const std::string& link_run_id, const std::string& step_id,
                                      ErrorKind kind, const std::string& message, json_mini::Doc extra) {
    json_mini::Doc errors = extra ? std::move(extra) : json_mini::new_object();
    put_if_absent(errors.root, "type", error_kind_name(kind));
    put_if_absent(errors.root, "message", message);
    put_if_absent(errors.root, "step_id", step_id);

    LedgerEvent ev = make_event(ctx, link.id, link_run_id, step_id, "FAILED", link.contract.contract_version);
    ev.errors = json_mini::Doc(json_mini::clone(errors.root));
    ev.metrics = run_metrics(ctx);
    h.ledger.log_event(ev);

    LinkFailure f(kind, message, std::move(errors));
    f.mark_logged();
    return f;
}

} // namespace dawn
