#include "cmd_lock.h"
#include "link_setup.h"
#include "runner_utils.h"

#include "dawn/lockfile.h"

#include <iostream>

using namespace dawn;

static int lock_compare(const std::string& a_path, const std::string& b_path) {
    std::string ea, eb;
    auto a = json_mini::parse_file(a_path, &ea);
    auto b = json_mini::parse_file(b_path, &eb);
    if (!json_mini::is_object(a.root) || !json_mini::is_object(b.root)) {
        std::cerr << "[ERROR] cannot read lockfiles: " << (ea.empty() ? eb : ea) << "\n";
        return 2;
    }
    auto diff = compare_lockfiles(a.root, b.root);
    if (diff.empty()) {
        std::cout << "Lockfiles are identical\n";
        return 0;
    }
    std::cout << "Lockfiles differ in " << diff.size() << " places\n";
    for (const auto& k : diff) std::cout << "  - " << k << "\n";
    return 1;
}

int cmd_lock(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2, {});
    if (args.positional.size() < 2) {
        std::cerr << "usage: dawn_cli lock <generate|verify> <project> | lock compare <a.json> <b.json>\n";
        return 2;
    }
    const std::string sub = args.positional[0];
    if (sub == "compare") {
        if (args.positional.size() < 3) {
            std::cerr << "usage: dawn_cli lock compare <a.json> <b.json>\n";
            return 2;
        }
        return lock_compare(args.positional[1], args.positional[2]);
    }

    const std::string project_id = args.positional[1];
    LinkRuntime rt;
    try {
        setup_runtime(rt, resolve_root(argv[0]));
        Lockfile lf(*rt.policy, rt.cfg.projects_dir, rt.cfg.links_dir);

        if (sub == "generate") {
            auto lock = lf.generate(project_id);
            if (args.has_switch("--stdout")) {
                print_json(lock.root, true);
                return 0;
            }
            auto path = lf.save(project_id, lock.root);
            json_object* links = json_mini::get(lock.root, "links");
            json_object* arts = json_mini::get(lock.root, "artifact_digests");
            std::cout << "Lockfile generated: " << path.string() << "\n";
            std::cout << "  Policy digest: " << short_digest(rt.policy->digest(), 16) << "...\n";
            std::cout << "  Pipeline digest: "
                      << short_digest(json_mini::get_string(json_mini::get(lock.root, "pipeline"), "digest").value_or("N/A"), 16)
                      << "...\n";
            std::cout << "  Links: " << (links ? json_object_object_length(links) : 0) << "\n";
            std::cout << "  Artifacts: " << (arts ? json_object_object_length(arts) : 0) << "\n";
            return 0;
        }
        if (sub == "verify") {
            LockVerifyResult r = lf.verify(project_id);
            if (r.verified) {
                std::cout << "Lockfile verification PASSED\n  Generated: " << r.generated_at << "\n";
                return 0;
            }
            std::cout << "Lockfile verification FAILED\n";
            if (!r.error.empty()) {
                std::cout << "  Error: " << r.error << "\n";
            } else {
                std::cout << "  Mismatches: " << r.mismatches.size() << "\n";
                for (const auto& m : r.mismatches) {
                    std::cout << "    - " << m.component << "." << m.field << "\n";
                    std::cout << "      Expected: " << m.expected << "\n";
                    std::cout << "      Actual:   " << m.actual << "\n";
                }
            }
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    std::cerr << "unknown lock subcommand: " << sub << "\n";
    return 2;
}
