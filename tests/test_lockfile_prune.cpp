#include "test_common.h"

#include "dawn/crypto.h"
#include "dawn/errors.h"
#include "dawn/inspect.h"
#include "dawn/lockfile.h"
#include "dawn/orchestrator.h"
#include "dawn/prune.h"

#include <algorithm>
#include <chrono>
#include <thread>

using namespace dawn;
namespace fs = std::filesystem;

namespace {

LinkFn writes(const std::string& aid) {
    return [aid](LinkContext& c) {
        c.sandbox->publish_text(aid, aid + ".txt", std::string(100, 'x'));
        return LinkResult::ok();
    };
}

bool has_item(const std::vector<PruneItem>& items, const std::string& aid, const std::string& reason = "") {
    return std::any_of(items.begin(), items.end(), [&](const PruneItem& it) {
        return it.artifact_id == aid && (reason.empty() || it.reason == reason);
    });
}

void settle() { std::this_thread::sleep_for(std::chrono::milliseconds(20)); }

} // namespace

int main() {
    setenv("DAWN_LOG_LEVEL", "error", 1);

    auto root = fresh_dir("dawn_test_lockfile_prune");
    const auto links = root / "links";
    const auto projects = root / "projects";
    write_text(root / "policy.yaml", policy_yaml());
    PolicyLoader policy(root / "policy.yaml");
    policy.load();

    for (const char* id : {"t.a", "t.b", "t.c"}) {
        write_link_manifest(links, id, std::string("  produces:\n    - artifact: ") + id + ".out\n      schema: text\n");
    }
    LinkRegistry registry;
    registry.discover(links);
    LinkTable table;
    table.add("t.a", writes("t.a.out"));
    table.add("t.b", writes("t.b.out"));
    table.add("t.c", writes("t.c.out"));
    Orchestrator orch(policy, registry, table, projects);

    auto pipeline = [&](const std::string& name, const std::string& body) {
        auto p = root / (name + ".yaml");
        write_text(p, "pipelineId: " + name + "\n" + body);
        return p;
    };
    const auto ab = pipeline("ab", "links: [t.a, t.b]\n");
    const auto c_only = pipeline("c_only", "links: [t.c]\n");

    // --- lockfile ---
    {
        orch.runPipeline("lock", ab);
        Lockfile lf(policy, projects, links);

        auto lock = lf.generate("lock");
        expect_eq_str(json_mini::get_string(lock.root, "lockfile_version").value_or(""), kLockfileVersion, "version");
        expect_eq_str(json_mini::get_string(json_mini::get(lock.root, "policy"), "digest").value_or(""),
                      policy.digest(), "policy digest");
        expect_eq_str(json_mini::get_string(json_mini::get(lock.root, "pipeline"), "pipeline_id").value_or(""), "ab",
                      "pipeline id from persisted pipeline.yaml");
        json_object* lk = json_mini::get(lock.root, "links");
        expect_eq_str(json_mini::get_string(json_mini::get(lk, "t.a"), "digest").value_or(""),
                      sha256_hex_file(links / "t.a" / "link.yaml"), "manifest digest");
        expect_eq_str(json_mini::get_string(json_mini::get(lock.root, "environment"), "compiler").value_or(""),
                      compiler_identity(), "compiler identity");
        json_object* digests = json_mini::get(lock.root, "artifact_digests");
        expect_true(json_mini::get_string(digests, "t.b.out").has_value(), "artifact digests");

        auto missing = lf.verify("lock");
        expect_true(!missing.verified && !missing.error.empty(), "verify without lockfile");

        const auto path = lf.save("lock");
        expect_true(path == projects / "lock" / kLockfileName, "lockfile path");
        auto v = lf.verify("lock");
        expect_true(v.verified, "fresh lockfile verifies");
        expect_eq_str(v.lockfile_version, kLockfileVersion, "verified version");

        auto before = lf.load("lock");
        write_text(links / "t.a" / "link.yaml", read_text(links / "t.a" / "link.yaml") + "# edited\n");
        v = lf.verify("lock");
        expect_true(!v.verified, "manifest edit detected");
        expect_eq_ll((long long)v.mismatches.size(), 1, "one mismatch");
        expect_eq_str(v.mismatches[0].component, "link:t.a", "mismatch component");

        auto after = lf.generate("lock");
        auto diff = compare_lockfiles(before.root, after.root);
        expect_eq_ll((long long)diff.size(), 1, "one differing section");
        expect_eq_str(diff[0], "links", "links section differs");
        expect_true(compare_lockfiles(after.root, after.root).empty(), "identical lockfiles");

        try {
            lf.generate("nope");
            die("unknown project should throw");
        } catch (const PipelineError&) {
        }
        write_text(projects / "lock" / kLockfileName, "[1,2]");
        try {
            lf.load("lock");
            die("non-object lockfile should throw");
        } catch (const std::runtime_error&) {
        }
    }

    // --- prune (keep_last_n_runs: 1) ---
    {
        const auto pr = orch.project_root("pr");
        orch.runPipeline("pr", ab);
        settle();
        orch.runPipeline("pr", c_only);
        settle();

        auto dry = prune_project(policy, pr, "pr", true);
        expect_true(dry.dry_run, "dry run flag");
        expect_true(has_item(dry.deleted, "t.a.out") && has_item(dry.deleted, "t.b.out"), "old run artifacts listed");
        expect_true(has_item(dry.preserved, "t.c.out", "kept_run"), "latest run kept");
        expect_true(has_item(dry.preserved, "dawn.metrics.run_summary", "protected_artifact"), "protected kept");
        expect_eq_ll((long long)dry.space_freed_bytes, 200, "bytes that would be freed");
        expect_true(fs::exists(pr / "artifacts" / "t.a" / "t.a.out.txt"), "dry run deletes nothing");

        auto real = prune_project(policy, pr, "pr", false);
        expect_eq_ll((long long)real.deleted.size(), 2, "two deleted");
        expect_true(real.errors.empty(), "no prune errors");
        expect_true(!fs::exists(pr / "artifacts" / "t.a" / "t.a.out.txt"), "file removed");
        auto idx = load_artifact_index(pr);
        expect_true(json_mini::get(idx.root, "t.a.out") == nullptr, "dropped from index");
        expect_true(json_mini::get(idx.root, "t.c.out") != nullptr, "kept in index");

        auto rep = real.to_json();
        expect_eq_ll(json_mini::get_int(rep.root, "deleted_count").value_or(-1), 2, "report count");

        // A reused link keeps its artifact alive.
        settle();
        auto ctx = orch.runPipeline("pr", c_only);
        expect_true(ctx.reused_links.count("t.c") == 1, "t.c reused");
        auto again = prune_project(policy, pr, "pr", true);
        expect_true(has_item(again.preserved, "t.c.out", "reused_by_kept_run"), "reused artifact preserved");
        expect_true(again.deleted.empty(), "nothing else to delete");

        auto gone = prune_project(policy, root / "projects" / "ghost", "ghost", true);
        expect_eq_ll((long long)gone.errors.size(), 1, "missing project reported");
    }

    // --- inspect ---
    {
        auto st = inspect_project(orch.project_root("pr"), "pr");
        expect_true(st.event_count > 0, "events counted");
        expect_true(st.chain.ok, "chain intact");
        expect_eq_ll((long long)st.runs.size(), 3, "three runs");
        expect_eq_str(st.runs[0].status, "SUCCEEDED", "latest run status");
        expect_true(st.runs[0].started_at >= st.runs[1].started_at, "newest first");
        auto it = std::find_if(st.last_status.begin(), st.last_status.end(),
                               [](const auto& kv) { return kv.first == "t.c"; });
        expect_true(it != st.last_status.end() && it->second == "SKIPPED", "last status of reused link");
        expect_true(json_mini::get(st.artifact_index.root, "t.c.out") != nullptr, "index rebuilt from ledger");

        try {
            inspect_project(root / "projects" / "ghost", "ghost");
            die("unknown project should throw");
        } catch (const PipelineError&) {
        }
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_lockfile_prune: ALL PASSED" << std::endl;
    return 0;
}
