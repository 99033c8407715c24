#include "cmd_run.h"
#include "link_setup.h"
#include "runner_utils.h"

#include "dawn/errors.h"
#include "dawn/orchestrator.h"
#include "dawn/pipeline.h"

#include <iostream>

using namespace dawn;

int cmd_run(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {"--profile"});
    if (args.positional.size() < 2) {
        std::cerr << "usage: dawn_cli run <project> <pipeline.yaml> [--profile P]\n";
        std::cerr << "env: DAWN_ROOT, DAWN_POLICY_PATH, DAWN_PROJECTS_DIR, DAWN_PLUGIN_DIR, DAWN_PROFILE\n";
        return 2;
    }
    const std::string project_id = args.positional[0];
    std::filesystem::path pipeline_path = args.positional[1];
    if (!pipeline_path.is_absolute()) pipeline_path = std::filesystem::absolute(pipeline_path);

    const auto root = resolve_root(argv[0]);
    LinkRuntime rt;
    PipelineSpec spec;
    try {
        setup_runtime(rt, root);
        spec = load_pipeline_spec(pipeline_path);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }

    OrchestratorOptions opts;
    opts.profile = args.option("--profile").value_or(rt.cfg.profile);
    opts.ledger_fsync = rt.cfg.ledger_fsync;

    auto out = json_mini::new_object();
    json_mini::put_string(out.root, "project_id", project_id);
    json_mini::put_string(out.root, "pipeline_id", spec.pipeline_id);
    try {
        Orchestrator orch(*rt.policy, rt.registry, rt.links, rt.cfg.projects_dir, opts);
        ProjectContext ctx = orch.runPipeline(project_id, spec);

        json_mini::put_bool(out.root, "ok", true);
        json_mini::put_string(out.root, "run_id", ctx.pipeline_run_id);
        json_mini::put_string(out.root, "profile", ctx.profile);
        json_mini::put_string(out.root, "project_root", ctx.project_root.string());
        json_mini::put(out.root, "links", ctx.link_durations.release());
        print_json(out.root, true);
        return 0;
    } catch (const PipelineRunError& e) {
        json_mini::put_bool(out.root, "ok", false);
        json_mini::put_string(out.root, "failed_link", e.link_id());
        json_mini::put_string(out.root, "error_type", error_kind_name(e.kind()));
        json_mini::put_string(out.root, "error", e.what());
        print_json(out.root, true);
        return 1;
    } catch (const ProjectBusyError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const PolicyValidationError& e) {
        std::cerr << "[ERROR] policy: " << e.what() << "\n";
        return 2;
    } catch (const PipelineError& e) {
        std::cerr << "[ERROR] pipeline: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
