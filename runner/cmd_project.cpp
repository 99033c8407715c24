#include "cmd_project.h"
#include "link_setup.h"
#include "runner_utils.h"

#include "dawn/errors.h"
#include "dawn/inspect.h"
#include "dawn/ledger.h"
#include "dawn/orchestrator.h"
#include "dawn/prune.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>

using namespace dawn;

namespace {

std::filesystem::path project_dir(const char* argv0, const std::string& project_id) {
    RuntimeConfig cfg = load_runtime_config(resolve_root(argv0));
    return cfg.projects_dir / project_id;
}

std::string pad(const std::string& s, size_t w) {
    return s.size() >= w ? s : s + std::string(w - s.size(), ' ');
}

} // namespace

int cmd_inspect(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {});
    if (args.positional.empty()) {
        std::cerr << "usage: dawn_cli inspect <project>\n";
        return 2;
    }
    const std::string project_id = args.positional[0];

    ProjectStatus st;
    try {
        st = inspect_project(project_dir(argv[0], project_id), project_id);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    if (st.event_count == 0) {
        std::cout << "Project " << project_id << " has no ledger events.\n";
        return 0;
    }

    std::cout << "DAWN PROJECT INSPECTOR: " << project_id << "\n\n";
    std::cout << "[PIPELINE STATUS]\n";
    for (const auto& kv : st.last_status) {
        std::cout << "  " << (kv.second == "FAILED" ? "x " : "  ") << pad(kv.first, 32) << kv.second << "\n";
    }

    std::cout << "\n[ARTIFACT INDEX]\n";
    bool any = false;
    json_object_object_foreach(st.artifact_index.root, aid, info) {
        any = true;
        std::cout << "  " << pad(aid, 36) << pad(json_mini::get_string(info, "link_id").value_or("?"), 28)
                  << short_digest(json_mini::get_string(info, "digest").value_or(""), 8) << "\n";
    }
    if (!any) std::cout << "  No artifacts found.\n";

    std::cout << "\n[RUNS]\n";
    for (const auto& r : st.runs) {
        std::cout << "  " << r.run_id << "  " << pad(r.status, 10) << r.events << " events\n";
    }

    if (!st.shadows.empty()) {
        std::cout << "\n[SHADOWS]\n";
        for (const auto& m : st.shadows) {
            char parity[32];
            std::snprintf(parity, sizeof(parity), "%.3f", m.last_parity);
            std::cout << "  " << m.stable << " <- " << m.shadow << "  runs=" << m.runs
                      << " consecutive=" << m.consecutive_parity << " last_parity=" << parity
                      << (m.approved ? " APPROVED" : (m.ready ? " READY" : "")) << "\n";
        }
    }

    std::cout << "\n[LEDGER]\n  " << st.event_count << " events, chain "
              << (st.chain.ok ? "intact" : "BROKEN at line " + std::to_string(st.chain.first_bad_line)) << "\n";
    return 0;
}

int cmd_verify_ledger(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {});
    if (args.positional.empty()) {
        std::cerr << "usage: dawn_cli verify-ledger <project>\n";
        return 2;
    }
    const auto root = project_dir(argv[0], args.positional[0]);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        std::cerr << "[ERROR] Project not found: " << args.positional[0] << "\n";
        return 1;
    }
    try {
        Ledger ledger(root);
        ChainReport r = ledger.verify_chain();
        if (r.ok) {
            std::cout << "ledger OK: " << r.lines << " events\n";
            return 0;
        }
        std::cout << "ledger BROKEN at line " << r.first_bad_line << ": " << r.error << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

int cmd_prune(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {});
    if (args.positional.empty()) {
        std::cerr << "usage: dawn_cli prune <project> [--dry-run] [--json]\n";
        return 2;
    }
    const std::string project_id = args.positional[0];
    const bool dry_run = args.has_switch("--dry-run");

    LinkRuntime rt;
    try {
        setup_runtime(rt, resolve_root(argv[0]));
        PruneReport report = prune_project(*rt.policy, rt.cfg.projects_dir / project_id, project_id, dry_run);

        if (args.has_switch("--json")) {
            auto j = report.to_json();
            print_json(j.root, true);
        } else {
            std::cout << (dry_run ? "DRY RUN" : "PRUNING") << " project " << project_id << "\n";
            std::cout << "  Preserved: " << report.preserved.size() << " artifacts\n";
            std::cout << "  Deleted: " << report.deleted.size() << " artifacts\n";
            std::cout << "  Errors: " << report.errors.size() << "\n";
            std::cout << "  Space " << (dry_run ? "that would be " : "") << "freed: " << report.space_freed_bytes
                      << " bytes\n";
            for (const auto& e : report.errors) std::cout << "    - " << e.artifact_id << ": " << e.reason << "\n";
        }
        return report.errors.empty() ? 0 : 1;
    } catch (const ProjectBusyError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

int cmd_approve_shadow(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {"--by"});
    if (args.positional.size() < 3) {
        std::cerr << "usage: dawn_cli approve-shadow <project> <stable> <shadow> [--by NAME]\n";
        return 2;
    }
    std::string approver = args.option("--by").value_or("");
    if (approver.empty()) {
        if (const char* u = std::getenv("USER")) approver = u;
    }

    LinkRuntime rt;
    try {
        setup_runtime(rt, resolve_root(argv[0]));
        OrchestratorOptions opts;
        opts.profile = rt.cfg.profile;
        opts.ledger_fsync = rt.cfg.ledger_fsync;
        Orchestrator orch(*rt.policy, rt.registry, rt.links, rt.cfg.projects_dir, opts);
        orch.approveShadowPromotion(args.positional[0], args.positional[1], args.positional[2], approver);
        std::cout << "approved: " << args.positional[2] << " replaces " << args.positional[1] << " in project "
                  << args.positional[0] << "\n";
        return 0;
    } catch (const ProjectBusyError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
