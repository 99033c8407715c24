#include "dawn/inspect.h"
#include "dawn/errors.h"

#include <algorithm>
#include <map>
#include <set>

namespace dawn {

std::vector<RunRecord> run_history(const std::vector<json_mini::Doc>& events) {
    std::map<std::string, RunRecord> runs;
    std::map<std::string, std::set<std::string>> seen_links;

    for (const auto& ev : events) {
        std::string run_id = json_mini::get_string(json_mini::get(ev.root, "metrics"), "run_id").value_or("");
        if (run_id.empty()) run_id = json_mini::get_string(ev.root, "run_id").value_or("");
        if (run_id.empty()) continue;

        const std::string step = json_mini::get_string(ev.root, "step_id").value_or("");
        const std::string status = json_mini::get_string(ev.root, "status").value_or("");
        const std::string link = json_mini::get_string(ev.root, "link_id").value_or("");
        const double ts = json_mini::get_number(ev.root, "timestamp").value_or(0.0);

        RunRecord& r = runs[run_id];
        if (r.run_id.empty()) {
            r.run_id = run_id;
            r.status = "UNKNOWN";
            r.started_at = ts;
            r.ended_at = ts;
        }
        r.events++;
        r.started_at = std::min(r.started_at, ts);
        r.ended_at = std::max(r.ended_at, ts);
        if (!link.empty() && seen_links[run_id].insert(link).second) r.links.push_back(link);

        // Shadow failures never fail a run.
        if (status == "FAILED" && step != "shadow_run") {
            r.status = "FAILED";
        } else if (r.status == "UNKNOWN" &&
                   ((step == "link_complete" && (status == "SUCCEEDED" || status == "SKIPPED")) ||
                    step == "skip")) {
            r.status = "SUCCEEDED";
        }
    }

    std::vector<RunRecord> out;
    out.reserve(runs.size());
    for (auto& kv : runs) out.push_back(std::move(kv.second));
    std::sort(out.begin(), out.end(),
              [](const RunRecord& a, const RunRecord& b) { return a.started_at > b.started_at; });
    return out;
}

ProjectStatus inspect_project(const std::filesystem::path& project_root, const std::string& project_id) {
    std::error_code ec;
    if (!std::filesystem::is_directory(project_root, ec)) {
        throw PipelineError("Project " + project_id + " not found at " + project_root.string());
    }

    ProjectStatus st;
    st.project_id = project_id;

    Ledger ledger(project_root);
    const auto events = ledger.get_events();
    st.event_count = events.size();

    std::map<std::string, size_t> pos;
    for (const auto& ev : events) {
        const std::string link = json_mini::get_string(ev.root, "link_id").value_or("");
        const std::string status = json_mini::get_string(ev.root, "status").value_or("");
        if (link.empty()) continue;
        auto it = pos.find(link);
        if (it == pos.end()) {
            pos[link] = st.last_status.size();
            st.last_status.emplace_back(link, status);
        } else {
            st.last_status[it->second].second = status;
        }
    }

    st.artifact_index = ledger.reconstruct_artifact_index();
    st.runs = run_history(events);
    st.chain = ledger.verify_chain();

    ShadowState shadows(project_root);
    shadows.load();
    st.shadows = shadows.entries();
    return st;
}

} // namespace dawn
