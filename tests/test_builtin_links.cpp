#include "test_common.h"

#include "builtin_links.h"
#include "dawn/artifact_store.h"
#include "dawn/orchestrator.h"
#include "dawn/sandbox.h"

using namespace dawn;
namespace fs = std::filesystem;

namespace {

const char* kBlueprint = R"({
  "name": "lab",
  "nodes": [
    {"name": "gw", "role": "gateway", "node_type": "router"},
    {"name": "web", "role": "frontend", "node_type": "vm"},
    {"name": "db", "role": "storage", "node_type": "vm"}
  ],
  "connections": [{"source_node": "gw", "target_node": "web"}],
  "groups": [{"name": "dmz", "member_nodes": ["web"]}]
})";

void seed_inputs(const fs::path& project_root) {
    write_text(project_root / "inputs" / "blueprint.json", kBlueprint);
    write_text(project_root / "inputs" / "docs" / "readme.txt", "lab notes");
    write_text(project_root / "inputs" / "hitl_review.json", "{}");
    write_text(project_root / "inputs" / "scratch.tmp", "tmp");
}

int count_steps(const fs::path& root, const std::string& link, const std::string& step, const std::string& status) {
    int n = 0;
    for (const auto& ev : Ledger(root).get_events(link)) {
        if (json_mini::get_string(ev.root, "step_id").value_or("") == step &&
            json_mini::get_string(ev.root, "status").value_or("") == status) {
            n++;
        }
    }
    return n;
}

LinkContext direct_ctx(const fs::path& root, Sandbox& sb, json_object* config) {
    LinkContext ctx;
    ctx.project_id = "direct";
    ctx.link_id = "direct";
    ctx.project_root = root;
    ctx.config = config;
    ctx.sandbox = &sb;
    return ctx;
}

} // namespace

int main() {
    setenv("DAWN_LOG_LEVEL", "error", 1);

    const fs::path src = DAWN_SOURCE_DIR;
    auto root = fresh_dir("dawn_test_builtin_links");
    const auto projects = root / "projects";

    PolicyLoader policy(src / "policy" / "runtime_policy.yaml");
    policy.load();
    LinkRegistry registry;
    registry.discover(src / "links");
    LinkTable table;
    register_builtin_links(table);
    expect_eq_ll((long long)table.ids().size(), 5, "five builtin links");

    Orchestrator orch(policy, registry, table, projects);
    const auto pipeline = src / "pipelines" / "blueprint_report.yaml";

    // Test 1: the shipped pipeline end to end.
    {
        seed_inputs(projects / "demo");
        auto ctx = orch.runPipeline("demo", pipeline);
        const auto pr = orch.project_root("demo");
        for (const char* id : {"ingest.project_bundle", "logic.generate_ir", "validate.json_artifacts",
                               "package.project_report"}) {
            expect_eq_str(ctx.status_index[id], "SUCCEEDED", std::string("status of ") + id);
        }

        auto bundle = json_mini::parse_file(pr / "artifacts" / "ingest.project_bundle" / "dawn.project.bundle.json");
        json_object* files = json_mini::get(bundle.root, "files");
        expect_eq_ll((long long)json_object_array_length(files), 2, "control files excluded from bundle");
        expect_eq_str(json_mini::get_string(json_object_array_get_idx(files, 0), "path").value_or(""),
                      "blueprint.json", "sorted bundle");
        expect_eq_ll(json_mini::get_int(json_mini::get(json_mini::get(ctx.link_durations.root,
                                                                      "ingest.project_bundle"), "metrics"),
                                        "files_excluded").value_or(-1),
                     2, "excluded count in metrics");

        auto ir = json_mini::parse_file(pr / "artifacts" / "logic.generate_ir" / "ir.json");
        expect_eq_str(json_mini::get_string(ir.root, "name").value_or(""), "lab", "ir published");

        auto validation = json_mini::parse_file(pr / "artifacts" / "validate.json_artifacts" /
                                                "validation_report.json");
        expect_eq_ll(json_mini::get_int(validation.root, "validated").value_or(0), 1, "bundle validated");

        const std::string report = read_text(pr / "artifacts" / "package.project_report" / "project_report.md");
        expect_true(report.find("# DAWN Audit Report: demo") != std::string::npos, "report title");
        expect_true(report.find("| logic.generate_ir | SUCCEEDED |") != std::string::npos, "report link table");
        expect_true(report.find("Overall status: **SUCCEEDED**") != std::string::npos, "report overall status");

        expect_eq_ll(count_steps(pr, "logic.generate_ir_v2", "shadow_run", "SUCCEEDED"), 1, "shadow ran");
        expect_true(fs::exists(pr / "shadow" / "logic.generate_ir_v2" / "ir_v2.json"), "shadow output isolated");

        // Second run: deterministic links are reused, the report always runs.
        auto again = orch.runPipeline("demo", pipeline);
        expect_true(again.reused_links.count("ingest.project_bundle") == 1, "ingest reused");
        expect_true(again.reused_links.count("logic.generate_ir") == 1, "generate_ir reused");
        expect_eq_ll(count_steps(pr, "ingest.project_bundle", "link_start", "STARTED"), 1, "ingest started once");
        expect_eq_ll(count_steps(pr, "ingest.project_bundle", "skip", "SKIPPED"), 1, "ingest skipped on rerun");
        expect_eq_ll(count_steps(pr, "logic.generate_ir", "link_start", "STARTED"), 1, "generate_ir started once");
        expect_true(again.reused_links.count("package.project_report") == 0, "report always runs");
        expect_eq_ll(count_steps(pr, "logic.generate_ir_v2", "shadow_run", "SUCCEEDED"), 2, "shadow ran again");
    }

    // Test 2: identical inputs give the same bundle digest.
    {
        seed_inputs(projects / "twin");
        orch.runPipeline("twin", pipeline);
        auto a = json_mini::parse_file(orch.project_root("demo") / "artifacts" / "ingest.project_bundle" /
                                       "dawn.project.bundle.json");
        auto b = json_mini::parse_file(orch.project_root("twin") / "artifacts" / "ingest.project_bundle" /
                                       "dawn.project.bundle.json");
        expect_eq_str(json_mini::get_string(a.root, "bundle_sha256").value_or("a"),
                      json_mini::get_string(b.root, "bundle_sha256").value_or("b"), "bundle digest is deterministic");
    }

    // Test 3: an IR that breaks the schema fails generate_ir.
    {
        write_text(projects / "broken" / "inputs" / "blueprint.json", R"({"name": "x", "nodes": []})");
        try {
            orch.runPipeline("broken", pipeline);
            die("schema-invalid IR should fail");
        } catch (const PipelineRunError& e) {
            expect_true(e.kind() == ErrorKind::SCHEMA_INVALID, "schema kind");
            expect_eq_str(e.link_id(), "logic.generate_ir", "failing link");
        }
    }

    // Test 4: links called directly.
    {
        const auto dr = root / "direct";
        ArtifactStore store(dr);
        Sandbox sb(store.artifacts_dir(), "direct", &store);

        auto cfg = json_mini::new_object();
        try {
            auto ctx = direct_ctx(dr, sb, cfg.root);
            link_ingest_project_bundle(ctx);
            die("ingest without inputs/ should throw");
        } catch (const std::runtime_error&) {
        }

        write_text(dr / "inputs" / "blueprint.json", "[1, 2]");
        auto ctx = direct_ctx(dr, sb, cfg.root);
        LinkResult r = link_generate_ir(ctx);
        expect_eq_str(r.status, "FAILED", "array blueprint rejected");
        expect_eq_str(json_mini::get_string(r.errors.root, "type").value_or(""), "SCHEMA_INVALID", "blueprint type");

        write_text(dr / "unversioned.json", R"({"a": 1})");
        write_text(dr / "enveloped.json", R"({"schema_version": "1", "format": "x", "payload": {"generated_by": "t"}})");
        auto vcfg = json_mini::parse(R"({"artifacts_to_validate": ["v.ok", "v.missing"],
                                         "enforce_generator_id": true, "allow_enveloped_payloads": true})");
        auto vctx = direct_ctx(dr, sb, vcfg.root);
        vctx.artifacts["v.ok"] = dr / "enveloped.json";
        r = link_validate_json_artifacts(vctx);
        expect_eq_str(r.status, "SUCCEEDED", "enveloped payload accepted");
        expect_eq_ll(json_mini::get_int(r.metrics.root, "skipped").value_or(0), 1, "unknown artifact skipped");

        auto bad = json_mini::parse(R"({"artifacts_to_validate": ["v.bad"]})");
        auto bctx = direct_ctx(dr, sb, bad.root);
        bctx.artifacts["v.bad"] = dr / "unversioned.json";
        r = link_validate_json_artifacts(bctx);
        expect_eq_str(r.status, "FAILED", "missing schema_version");
        expect_eq_str(json_mini::get_string(r.errors.root, "artifact_id").value_or(""), "v.bad", "failing artifact");
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_builtin_links: ALL PASSED" << std::endl;
    return 0;
}
