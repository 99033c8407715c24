#include "dawn/prune.h"
#include "dawn/artifact_store.h"
#include "dawn/config.h"
#include "dawn/fs_util.h"
#include "dawn/inspect.h"
#include "dawn/ledger.h"
#include "dawn/project_lock.h"

#include <memory>
#include <set>

namespace dawn {

namespace {

json_object* items_json(const std::vector<PruneItem>& items, const char* reason_key) {
    json_object* arr = json_object_new_array();
    for (const auto& it : items) {
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "artifact_id", it.artifact_id);
        json_mini::put_string(o, reason_key, it.reason);
        json_mini::put_string(o, "path", it.path);
        if (it.size_bytes) json_mini::put_int(o, "size_bytes", (int64_t)it.size_bytes);
        json_object_array_add(arr, o);
    }
    return arr;
}

uint64_t size_of(const std::filesystem::path& p) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(p, ec)) {
        auto n = std::filesystem::file_size(p, ec);
        return ec ? 0 : (uint64_t)n;
    }
    uint64_t total = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(p, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) total += (uint64_t)it->file_size(ec);
    }
    return total;
}

void remove_empty_link_dirs(const std::filesystem::path& artifacts_dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(artifacts_dir, ec)) return;
    std::vector<std::filesystem::path> empty;
    for (const auto& d : std::filesystem::directory_iterator(artifacts_dir, ec)) {
        if (d.is_directory(ec) && std::filesystem::is_empty(d.path(), ec)) empty.push_back(d.path());
    }
    for (const auto& p : empty) std::filesystem::remove(p, ec);
}

} // namespace

json_mini::Doc PruneReport::to_json() const {
    auto d = json_mini::new_object();
    json_mini::put_string(d.root, "project_id", project_id);
    json_mini::put_string(d.root, "timestamp", iso_utc_now());
    json_mini::put_bool(d.root, "dry_run", dry_run);
    json_mini::put_int(d.root, "preserved_count", (int64_t)preserved.size());
    json_mini::put_int(d.root, "deleted_count", (int64_t)deleted.size());
    json_mini::put_int(d.root, "error_count", (int64_t)errors.size());
    json_mini::put_int(d.root, "space_freed_bytes", (int64_t)space_freed_bytes);
    json_mini::put(d.root, "preserved", items_json(preserved, "reason"));
    json_mini::put(d.root, "deleted", items_json(deleted, "reason"));
    json_mini::put(d.root, "errors", items_json(errors, "error"));
    return d;
}

PruneReport prune_project(const PolicyLoader& policy, const std::filesystem::path& project_root,
                          const std::string& project_id, bool dry_run) {
    PruneReport report;
    report.project_id = project_id;
    report.dry_run = dry_run;

    std::error_code ec;
    if (!std::filesystem::is_directory(project_root, ec)) {
        report.errors.push_back({"__project__", "Project not found: " + project_id, project_root.string(), 0});
        return report;
    }

    std::unique_ptr<ProjectLock> lock;
    if (!dry_run) lock = std::make_unique<ProjectLock>(project_root);

    const auto runs = run_history(Ledger(project_root).get_events());

    std::set<std::string> known_runs;
    std::set<std::string> kept_runs;
    std::set<std::string> kept_links;
    const int keep_n = policy.keep_last_n_runs();
    const double cutoff = epoch_now() - (double)policy.keep_failed_runs_days() * 86400.0;
    int succeeded = 0;
    for (const auto& r : runs) {
        known_runs.insert(r.run_id);
        bool keep = false;
        if (r.status == "SUCCEEDED" && succeeded < keep_n) {
            keep = true;
            succeeded++;
        } else if (r.status == "FAILED" && r.ended_at > cutoff) {
            keep = true;
        }
        if (!keep) continue;
        kept_runs.insert(r.run_id);
        kept_links.insert(r.links.begin(), r.links.end());
    }

    const auto protected_ids = policy.protected_artifacts();
    const std::set<std::string> protected_set(protected_ids.begin(), protected_ids.end());

    auto index = load_artifact_index(project_root);
    std::vector<std::string> dropped;

    json_object_object_foreach(index.root, aid, info) {
        const std::string path = json_mini::get_string(info, "path").value_or("");
        const std::string run_id = json_mini::get_string(info, "run_id").value_or("");
        const std::string link_id = json_mini::get_string(info, "link_id").value_or("");

        std::string keep_reason;
        if (protected_set.count(aid)) keep_reason = "protected_artifact";
        else if (run_id.empty()) keep_reason = "no_run_tracking";
        else if (kept_runs.count(run_id)) keep_reason = "kept_run";
        else if (kept_links.count(link_id)) keep_reason = "reused_by_kept_run";
        else if (!known_runs.count(run_id)) keep_reason = "unknown_run";

        if (!keep_reason.empty()) {
            report.preserved.push_back({aid, keep_reason, path, 0});
            continue;
        }

        if (path.empty() || !std::filesystem::exists(path, ec)) {
            dropped.push_back(aid);
            continue;
        }
        const uint64_t size = size_of(path);
        if (dry_run) {
            report.deleted.push_back({aid, "retention_policy (dry-run)", path, size});
            report.space_freed_bytes += size;
            continue;
        }
        std::filesystem::remove_all(path, ec);
        if (ec) {
            report.errors.push_back({aid, ec.message(), path, 0});
            ec.clear();
            continue;
        }
        report.deleted.push_back({aid, "retention_policy", path, size});
        report.space_freed_bytes += size;
        dropped.push_back(aid);
    }

    if (dry_run) return report;

    for (const auto& aid : dropped) json_object_object_del(index.root, aid.c_str());
    if (!dropped.empty()) {
        std::string err = save_artifact_index(project_root, index.root);
        if (!err.empty()) report.errors.push_back({"__index__", err, (project_root / "artifact_index.json").string(), 0});
    }
    remove_empty_link_dirs(project_root / "artifacts");

    log_line(LogLevel::INFO, "pruned project " + project_id + ": " + std::to_string(report.deleted.size()) +
                                 " deleted, " + std::to_string(report.preserved.size()) + " preserved");
    return report;
}

} // namespace dawn
