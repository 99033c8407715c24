#include "builtin_links.h"

#include "dawn/fs_util.h"
#include "dawn/json_mini.h"
#include "dawn/ledger.h"
#include "dawn/policy.h"

#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace dawn {

namespace {

std::string budget_str(const PolicyLoader* policy, const char* section, const char* key) {
    if (!policy) return "n/a";
    auto v = policy->get_budget(section, key);
    return v ? std::to_string(*v) : "unlimited";
}

} // namespace

// Markdown audit report of the project: per-link status from the ledger,
// budget violations, failure diagnostics and the artifact table.
LinkResult link_package_project_report(LinkContext& ctx) {
    Ledger ledger(ctx.project_root);
    const auto events = ledger.get_events();

    std::vector<std::string> order;
    std::map<std::string, std::string> status;
    std::map<std::string, std::string> last_error;
    std::vector<std::string> violations;
    for (const auto& ev : events) {
        const std::string link = json_mini::get_string(ev.root, "link_id").value_or("");
        const std::string st = json_mini::get_string(ev.root, "status").value_or("");
        if (link.empty()) continue;
        if (st == "SUCCEEDED" || st == "FAILED" || st == "SKIPPED") {
            if (!status.count(link)) order.push_back(link);
            status[link] = st;
        }
        json_object* errors = json_mini::get(ev.root, "errors");
        auto type = json_mini::get_string(errors, "type");
        auto msg = json_mini::get_string(errors, "message");
        if (msg) last_error[link] = *msg;
        if (type && type->rfind("BUDGET_", 0) == 0) {
            violations.push_back(link + ": " + *type + " " + msg.value_or(""));
        }
    }

    std::string overall = "SUCCEEDED";
    std::string failed_link;
    for (const auto& id : order) {
        if (status[id] == "FAILED") {
            overall = "FAILED";
            failed_link = id;
            break;
        }
    }

    std::ostringstream md;
    md << "# DAWN Audit Report: " << ctx.project_id << "\n\n";
    md << "- Pipeline: `" << ctx.pipeline_id << "`\n";
    md << "- Run: `" << ctx.pipeline_run_id << "`\n";
    md << "- Profile: `" << ctx.profile << "`\n";
    md << "- Policy: " << (ctx.policy ? ctx.policy->version() : std::string("unknown")) << "\n";
    md << "- Generated: " << iso_utc_now() << "\n";
    md << "- Overall status: **" << overall << "**\n\n";

    if (!failed_link.empty()) {
        md << "## Failure Diagnostics\n\n";
        md << "Failure at `" << failed_link << "`: " << last_error[failed_link] << "\n\n";
        md << "Inspect with `dawn_cli inspect " << ctx.project_id << "`.\n\n";
    }

    md << "## Budgets\n\n";
    md << "| Budget | Limit |\n|---|---|\n";
    md << "| per_link.max_wall_time_sec | " << budget_str(ctx.policy, "per_link", "max_wall_time_sec") << " |\n";
    md << "| per_link.max_output_bytes | " << budget_str(ctx.policy, "per_link", "max_output_bytes") << " |\n";
    md << "| per_project.max_project_bytes | " << budget_str(ctx.policy, "per_project", "max_project_bytes")
       << " |\n\n";
    if (!violations.empty()) {
        md << "### Budget Violations\n\n";
        for (const auto& v : violations) md << "- " << v << "\n";
        md << "\n";
    }

    md << "## Links\n\n| Link | Status |\n|---|---|\n";
    for (const auto& id : order) md << "| " << id << " | " << status[id] << " |\n";

    md << "\n## Artifacts\n\n| Artifact | Path |\n|---|---|\n";
    for (const auto& kv : ctx.artifacts) {
        md << "| " << kv.first << " | " << kv.second.lexically_relative(ctx.project_root).generic_string() << " |\n";
    }

    ctx.sandbox->publish_text("dawn.project.report", "project_report.md", md.str(), "markdown");

    LinkResult r;
    r.metrics = json_mini::new_object();
    json_mini::put_int(r.metrics.root, "links_reported", (int64_t)order.size());
    json_mini::put_int(r.metrics.root, "artifacts_reported", (int64_t)ctx.artifacts.size());
    json_mini::put_int(r.metrics.root, "budget_violations", (int64_t)violations.size());
    return r;
}

} // namespace dawn
