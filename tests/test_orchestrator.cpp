#include "test_common.h"

#include "dawn/errors.h"
#include "dawn/orchestrator.h"
#include "dawn/project_lock.h"

#include <chrono>
#include <memory>
#include <thread>

using namespace dawn;

namespace {

// Policy, links and implementations for one scratch root.
struct Fixture {
    std::filesystem::path root;
    std::filesystem::path links;
    std::filesystem::path projects;
    std::unique_ptr<PolicyLoader> policy;
    LinkRegistry registry;
    LinkTable table;

    Fixture(const std::string& name, const std::string& policy_text) : root(fresh_dir(name)) {
        links = root / "links";
        projects = root / "projects";
        write_text(root / "policy.yaml", policy_text);
        policy = std::make_unique<PolicyLoader>(root / "policy.yaml");
        policy->load();
    }

    void discover() { registry.discover(links); }

    std::filesystem::path pipeline(const std::string& name, const std::string& body) {
        auto p = root / (name + ".yaml");
        write_text(p, "pipelineId: " + name + "\n" + body);
        return p;
    }
};

LinkResult publish_json(LinkContext& ctx, const std::string& aid, const std::string& rel) {
    auto d = json_mini::new_object();
    json_mini::put_string(d.root, "schema_version", "1.0.0");
    json_mini::put_int(d.root, "n", json_mini::get_int(ctx.config, "n").value_or(1));
    ctx.sandbox->publish(aid, rel, d.root);
    return LinkResult::ok();
}

void setup_links(Fixture& f) {
    write_link_manifest(f.links, "t.produce",
                        "  produces:\n    - artifact: t.data\n      schema:\n        type: json\n");
    write_link_manifest(f.links, "t.consume",
                        "  requires:\n    - artifact: t.data\n      from_link: t.produce\n"
                        "  produces:\n    - artifact: t.result\n      schema: json\n"
                        "  when:\n    condition: on_success(t.produce)\n");
    write_link_manifest(f.links, "t.needs",
                        "  requires:\n    - artifact: t.data\n      from_link: t.produce\n"
                        "    - artifact: t.optional\n      optional: true\n");
    write_link_manifest(f.links, "t.on_fail", "  when:\n    condition: on_failure(t.produce)\n");
    write_link_manifest(f.links, "t.if_exists",
                        "  when:\n    condition: if_artifact_exists(t.data)\n"
                        "  produces:\n    - artifact: t.exists\n      schema: json\n");
    write_link_manifest(f.links, "t.sleep", "  runtime:\n    max_wall_time_sec: 2\n");
    write_link_manifest(f.links, "t.bad_schema",
                        "  produces:\n    - artifact: t.ir\n      schema:\n        type: json\n"
                        "        ref: dawn.project.ir\n");
    write_link_manifest(f.links, "t.not_json", "  produces:\n    - artifact: t.txt\n      schema: json\n");
    write_link_manifest(f.links, "impl.apply_patchset", "  produces: []\n");
    write_link_manifest(f.links, "t.rogue", "  produces: []\n");
    write_link_manifest(f.links, "t.silent", "  produces:\n    - artifact: t.silent.out\n");
    write_link_manifest(f.links, "t.big", "  produces:\n    - artifact: t.big.out\n      schema: text\n");
    write_link_manifest(f.links, "t.reports_failure", "  produces: []\n");
    write_link_manifest(f.links, "t.bundle", "  produces:\n    - artifact: dawn.project.bundle\n      schema: json\n");
    f.discover();

    f.table.add("t.produce", [](LinkContext& c) { return publish_json(c, "t.data", "data.json"); });
    f.table.add("t.consume", [](LinkContext& c) {
        if (!c.artifacts.count("t.data")) return LinkResult::failed("MISSING_REQUIRED_ARTIFACT", "no t.data");
        return publish_json(c, "t.result", "result.json");
    });
    f.table.add("t.needs", [](LinkContext&) { return LinkResult::ok(); });
    f.table.add("t.on_fail", [](LinkContext&) { return LinkResult::ok(); });
    f.table.add("t.if_exists", [](LinkContext& c) { return publish_json(c, "t.exists", "exists.json"); });
    f.table.add("t.sleep", [](LinkContext&) {
        std::this_thread::sleep_for(std::chrono::seconds(10));
        return LinkResult::ok();
    });
    f.table.add("t.bad_schema", [](LinkContext& c) {
        auto d = json_mini::new_object();
        json_mini::put_int(d.root, "foo", 1);
        c.sandbox->publish("t.ir", "ir.json", d.root);
        return LinkResult::ok();
    });
    f.table.add("t.not_json", [](LinkContext& c) {
        c.sandbox->publish_text("t.txt", "t.json", "this is not json", "json");
        return LinkResult::ok();
    });
    f.table.add("impl.apply_patchset", [](LinkContext& c) {
        write_text(c.project_root / "src" / "patch.c", "/* patched */\n");
        return LinkResult::ok();
    });
    f.table.add("t.rogue", [](LinkContext& c) {
        write_text(c.project_root / "rogue.txt", "outside");
        return LinkResult::ok();
    });
    f.table.add("t.silent", [](LinkContext&) { return LinkResult::ok(); });
    f.table.add("t.big", [](LinkContext& c) {
        c.sandbox->publish_text("t.big.out", "big.txt", std::string(5000, 'x'));
        return LinkResult::ok();
    });
    f.table.add("t.bundle", [](LinkContext& c) {
        auto d = json_mini::new_object();
        json_mini::put_string(d.root, "bundle_sha256", std::string(64, 'a'));
        c.sandbox->publish("dawn.project.bundle", "bundle.json", d.root);
        return LinkResult::ok();
    });
    f.table.add("t.reports_failure",
                [](LinkContext&) { return LinkResult::failed("RUNTIME_ERROR", "upstream service said no"); });
}

// Runs a pipeline expected to fail and returns the error.
PipelineRunError run_failing(Orchestrator& o, const std::string& project, const std::filesystem::path& pipe,
                             const std::string& profile = "") {
    try {
        o.runPipeline(project, pipe, profile);
    } catch (const PipelineRunError& e) {
        return e;
    }
    die("pipeline " + pipe.filename().string() + " on " + project + " should have failed");
    return PipelineRunError("", ErrorKind::RUNTIME_ERROR, "");
}

bool has_event(const std::filesystem::path& project_root, const std::string& link, const std::string& step,
               const std::string& status) {
    Ledger l(project_root);
    for (const auto& ev : l.get_events(link)) {
        if (json_mini::get_string(ev.root, "step_id").value_or("") == step &&
            json_mini::get_string(ev.root, "status").value_or("") == status) {
            return true;
        }
    }
    return false;
}

int count_events(const std::filesystem::path& project_root, const std::string& link, const std::string& step,
                 const std::string& status) {
    int n = 0;
    for (const auto& ev : Ledger(project_root).get_events(link)) {
        if (json_mini::get_string(ev.root, "step_id").value_or("") == step &&
            json_mini::get_string(ev.root, "status").value_or("") == status) {
            n++;
        }
    }
    return n;
}

// Latest matching ledger event; empty Doc when there is none.
json_mini::Doc find_event(const std::filesystem::path& project_root, const std::string& link,
                          const std::string& step, const std::string& status) {
    auto events = Ledger(project_root).get_events(link);
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if (json_mini::get_string(it->root, "step_id").value_or("") == step &&
            json_mini::get_string(it->root, "status").value_or("") == status) {
            return std::move(*it);
        }
    }
    return json_mini::Doc();
}

// artifact_index.json without the per-run summary and the run stamps.
std::string stable_index(const std::filesystem::path& project_root) {
    auto idx = load_artifact_index(project_root);
    json_object_object_del(idx.root, "dawn.metrics.run_summary");
    json_object_object_foreach(idx.root, aid, entry) {
        (void)aid;
        json_object_object_del(entry, "run_id");
        json_object_object_del(entry, "created_at");
    }
    return json_mini::canonical(idx.root);
}

std::string summary_status(const std::filesystem::path& project_root) {
    auto doc = json_mini::parse_file(project_root / "artifacts" / "package.metrics" / "run_summary.json");
    return json_mini::get_string(doc.root, "status").value_or("");
}

} // namespace

int main() {
    setenv("DAWN_LOG_LEVEL", "error", 1);

    Fixture f("dawn_test_orchestrator", policy_yaml());
    setup_links(f);
    OrchestratorOptions opts;
    opts.worker_id = "test-worker";
    Orchestrator orch(*f.policy, f.registry, f.table, f.projects, opts);
    expect_eq_str(orch.default_profile(), "normal", "policy default profile");

    const auto basic = f.pipeline("basic", "links:\n  - t.produce\n  - t.consume\n  - t.on_fail\n  - t.if_exists\n");

    // Test 1: happy path, conditions and bookkeeping.
    {
        auto ctx = orch.runPipeline("alpha", basic);
        const auto root = orch.project_root("alpha");
        expect_true(!ctx.failed, "pipeline succeeded");
        expect_eq_str(ctx.status_index["t.produce"], "SUCCEEDED", "produce ran");
        expect_eq_str(ctx.status_index["t.consume"], "SUCCEEDED", "consume ran after on_success");
        expect_eq_str(ctx.status_index["t.on_fail"], "SKIPPED", "on_failure skipped");
        expect_eq_str(ctx.status_index["t.if_exists"], "SUCCEEDED", "if_artifact_exists ran");
        expect_true(json_mini::get(ctx.artifact_index.root, "t.result") != nullptr, "result indexed");
        expect_true(json_mini::get(ctx.artifact_index.root, "dawn.metrics.run_summary") != nullptr,
                    "run summary indexed");
        expect_eq_str(summary_status(root), "SUCCEEDED", "run summary status");
        expect_true(std::filesystem::exists(root / "pipeline.yaml"), "pipeline persisted");
        expect_true(std::filesystem::exists(root / "artifacts" / "t.produce" / ".dawn_artifacts.json"),
                    "per-link manifest saved");
        expect_true(has_event(root, "t.on_fail", "evaluate_condition", "SKIPPED"), "condition skip logged");
        expect_true(has_event(root, "t.produce", "link_start", "STARTED"), "start logged");
        expect_true(has_event(root, "t.produce", "link_complete", "SUCCEEDED"), "completion logged");
        expect_true(Ledger(root).verify_chain().ok, "ledger chain intact");
        expect_eq_str(ctx.worker_id, "test-worker", "worker id");

        auto idx = load_artifact_index(root);
        expect_eq_str(json_mini::get_string(json_mini::get(idx.root, "t.data"), "run_id").value_or(""),
                      ctx.pipeline_run_id, "index entry stamped with run id");
    }

    // Test 2: identical inputs are not executed again.
    {
        auto ctx = orch.runPipeline("alpha", basic);
        const auto root = orch.project_root("alpha");
        expect_true(ctx.reused_links.count("t.produce") && ctx.reused_links.count("t.consume"), "links reused");
        expect_true(has_event(root, "t.produce", "skip", "SKIPPED"), "skip logged");
        expect_true(json_mini::get(ctx.artifact_index.root, "t.data") != nullptr, "reused artifact still indexed");
        expect_eq_str(ctx.status_index["t.consume"], "SKIPPED", "consume reused after reused producer");

        // a config change invalidates the signature
        const auto changed = f.pipeline("changed", "links:\n  - id: t.produce\n    config:\n      n: 2\n");
        auto ctx2 = orch.runPipeline("alpha", changed);
        expect_true(!ctx2.reused_links.count("t.produce"), "changed config re-executes");
        auto doc = json_mini::parse_file(root / "artifacts" / "t.produce" / "data.json");
        expect_eq_ll(json_mini::get_int(doc.root, "n").value_or(0), 2, "new config reached the link");
    }

    // Test 2b: a rerun with a bundle producer reuses every link and leaves
    // the artifact index unchanged.
    {
        const auto p = f.pipeline("bundled", "links:\n  - t.produce\n  - t.bundle\n  - t.consume\n");
        auto first = orch.runPipeline("alpha_bundle", p);
        const auto root = orch.project_root("alpha_bundle");
        expect_true(!first.failed, "bundled pipeline succeeded");
        const std::string index_before = stable_index(root);

        auto second = orch.runPipeline("alpha_bundle", p);
        for (const char* id : {"t.produce", "t.bundle", "t.consume"}) {
            expect_true(second.reused_links.count(id) == 1, std::string(id) + " reused");
            expect_eq_ll(count_events(root, id, "link_start", "STARTED"), 1, std::string(id) + " started once");
            expect_eq_ll(count_events(root, id, "skip", "SKIPPED"), 1, std::string(id) + " skipped on rerun");
        }
        expect_eq_str(stable_index(root), index_before, "artifact index identical across runs");
    }

    // Test 2c: a matching signature whose outputs are gone fails instead of re-executing.
    {
        orch.runPipeline("alpha_lost", basic);
        const auto root = orch.project_root("alpha_lost");
        std::filesystem::remove(root / "artifacts" / "t.produce" / "data.json");
        auto e = run_failing(orch, "alpha_lost", basic);
        expect_true(e.kind() == ErrorKind::REHYDRATION_FAILED, "rehydration failure kind");
        expect_eq_str(e.link_id(), "t.produce", "failing link");
        expect_true(has_event(root, "t.produce", "validate_skip", "FAILED"), "validate_skip failure logged");
        expect_eq_ll(count_events(root, "t.produce", "link_start", "STARTED"), 1, "not re-executed");
    }

    // Test 3: missing required input.
    {
        // without its producer in the pipeline the guarded consumer is skipped
        auto skipped = orch.runPipeline("beta0", f.pipeline("consume_only", "links:\n  - t.consume\n"));
        expect_eq_str(skipped.status_index["t.consume"], "SKIPPED", "on_success of an absent link skips");

        const auto p = f.pipeline("needs_only", "links:\n  - t.needs\n");
        auto e = run_failing(orch, "beta", p);
        const auto root = orch.project_root("beta");
        expect_true(e.kind() == ErrorKind::MISSING_REQUIRED_ARTIFACT, "missing input kind");
        expect_eq_str(e.link_id(), "t.needs", "failing link");
        expect_true(std::string(e.what()).find("t.data") != std::string::npos, "required artifact named");
        expect_true(std::string(e.what()).find("t.optional") == std::string::npos, "optional input tolerated");
        expect_true(has_event(root, "t.needs", "validate_inputs", "FAILED"), "input failure logged");
        expect_eq_str(summary_status(root), "FAILED", "summary written on failure");
    }

    // Test 4: wall-time budget kills the link.
    {
        const auto p = f.pipeline("sleepy", "links:\n  - t.sleep\n");
        auto t0 = std::chrono::steady_clock::now();
        auto e = run_failing(orch, "gamma", p);
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(e.kind() == ErrorKind::BUDGET_TIMEOUT, "timeout kind");
        expect_true(secs < 8, "timeout enforced near 2s");
        auto doc = json_mini::parse_file(orch.project_root("gamma") / "artifacts" / "package.metrics" /
                                         "run_summary.json");
        json_object* v = json_mini::get(doc.root, "budget_violations");
        expect_true(json_mini::is_array(v) && json_object_array_length(v) == 1, "violation recorded in summary");

        auto ev = find_event(orch.project_root("gamma"), "t.sleep", "link_complete", "FAILED");
        expect_true(ev.root != nullptr, "timeout logged as failed link_complete");
        json_object* errors = json_mini::get(ev.root, "errors");
        expect_eq_str(json_mini::get_string(errors, "type").value_or(""), "BUDGET_TIMEOUT", "timeout event type");
        expect_eq_ll(json_mini::get_int(errors, "timeout_sec").value_or(0), 2, "timeout_sec in ledger");
    }

    // Test 5: schema validation of produced JSON.
    {
        auto e = run_failing(orch, "delta", f.pipeline("bad_schema", "links:\n  - t.bad_schema\n"));
        expect_true(e.kind() == ErrorKind::SCHEMA_INVALID, "structural schema failure");
        expect_true(std::string(e.what()).find("name: required") != std::string::npos,
                    "violation location reported: " + std::string(e.what()));

        auto idx = load_artifact_index(orch.project_root("delta"));
        expect_true(!json_object_object_get_ex(idx.root, "t.ir", nullptr), "invalid artifact not indexed");

        auto e2 = run_failing(orch, "delta2", f.pipeline("not_json", "links:\n  - t.not_json\n"));
        expect_true(e2.kind() == ErrorKind::SCHEMA_INVALID, "invalid JSON");
    }

    // Test 6: sandbox enforcement.
    {
        const auto p = f.pipeline("patch", "links:\n  - impl.apply_patchset\n");
        auto ok = orch.runPipeline("eps", p);
        expect_true(!ok.failed, "granted src write allowed in normal profile");

        auto e = run_failing(orch, "eps_iso", p, "isolation");
        expect_true(e.kind() == ErrorKind::POLICY_VIOLATION, "src write blocked under isolation");
        expect_true(has_event(orch.project_root("eps_iso"), "impl.apply_patchset", "sandbox_check", "FAILED"),
                    "sandbox failure logged");

        auto e2 = run_failing(orch, "eps_rogue", f.pipeline("rogue", "links:\n  - t.rogue\n"));
        expect_true(e2.kind() == ErrorKind::POLICY_VIOLATION, "write outside roots blocked");
        expect_true(std::string(e2.what()).find("rogue.txt") != std::string::npos, "leaked path named");
        auto ev = find_event(orch.project_root("eps_rogue"), "t.rogue", "sandbox_check", "FAILED");
        expect_true(ev.root != nullptr, "rogue sandbox failure logged");
        auto leaked = json_mini::get_array_strings(json_mini::get(ev.root, "errors"), "leaked_paths");
        expect_eq_ll((long long)leaked.size(), 1, "exactly one leaked path");
        expect_eq_str(leaked.empty() ? "" : leaked[0], "rogue.txt", "leaked path is the rogue file");
    }

    // Test 7: declared output never published.
    {
        auto e = run_failing(orch, "zeta", f.pipeline("silent", "links:\n  - t.silent\n"));
        expect_true(e.kind() == ErrorKind::PRODUCED_ARTIFACT_MISSING, "missing output");
    }

    // Test 8: link-reported failure keeps its type and stops the pipeline.
    {
        auto e = run_failing(orch, "eta", f.pipeline("reports", "links:\n  - t.reports_failure\n  - t.produce\n"));
        expect_true(e.kind() == ErrorKind::RUNTIME_ERROR, "reported kind");
        expect_true(std::string(e.what()).find("upstream service said no") != std::string::npos, "reason kept");
        expect_true(!has_event(orch.project_root("eta"), "t.produce", "link_start", "STARTED"),
                    "later links not started");
    }

    // Test 9: busy project.
    {
        const auto root = orch.project_root("theta");
        ProjectLock held(root);
        try {
            orch.runPipeline("theta", basic);
            die("locked project should be busy");
        } catch (const ProjectBusyError&) {
        }
    }

    // Test 10: rejected before anything runs.
    {
        const auto p = f.pipeline("unknown", "links:\n  - t.produce\n  - no.such.link\n");
        try {
            orch.runPipeline("iota", p);
            die("unknown link should be rejected");
        } catch (const PipelineError&) {
        }
        expect_true(!std::filesystem::exists(orch.project_root("iota") / "ledger" / "events.jsonl"),
                    "nothing logged for a rejected pipeline");

        try {
            orch.runPipeline("../escape", basic);
            die("bad project id should be rejected");
        } catch (const PipelineError&) {
        }
        try {
            orch.runPipeline("kappa", basic, "turbo");
            die("unknown profile should be rejected");
        } catch (const PolicyValidationError&) {
        }
    }

    // Test 11: project and output size budgets.
    {
        Fixture small("dawn_test_orchestrator_small", policy_yaml(60, 1000, 10000));
        setup_links(small);
        Orchestrator o(*small.policy, small.registry, small.table, small.projects);

        write_text(o.project_root("huge") / "inputs" / "blob.bin", std::string(50000, 'b'));
        auto e = run_failing(o, "huge", small.pipeline("basic", "links:\n  - t.produce\n"));
        expect_true(e.kind() == ErrorKind::BUDGET_PROJECT_LIMIT, "project limit kind");
        expect_eq_str(e.link_id(), "__preflight__", "preflight failure");
        expect_true(has_event(o.project_root("huge"), "__preflight__", "budget_check", "FAILED"),
                    "budget failure logged");
        expect_true(!std::filesystem::exists(o.project_root("huge") / "artifacts" / "t.produce"),
                    "no link ran");

        auto e2 = run_failing(o, "wide", small.pipeline("big", "links:\n  - t.big\n"));
        expect_true(e2.kind() == ErrorKind::BUDGET_OUTPUT_LIMIT, "output limit kind");

        std::error_code ec;
        std::filesystem::remove_all(small.root, ec);
    }

    std::error_code ec;
    std::filesystem::remove_all(f.root, ec);
    std::cerr << "test_orchestrator: ALL PASSED" << std::endl;
    return 0;
}
