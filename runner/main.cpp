#include "cmd_lock.h"
#include "cmd_project.h"
#include "cmd_run.h"
#include "link_setup.h"
#include "runner_utils.h"

#include "dawn/config.h"

#include <iostream>
#include <string>

// Lists every manifest and whether an implementation is registered for it.
static int cmd_links(int /*argc*/, char** argv) {
    using namespace dawn;
    LinkRuntime rt;
    try {
        setup_runtime(rt, resolve_root(argv[0]));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
    for (const auto& id : rt.registry.listLinks()) {
        const LinkEntry* e = rt.registry.getLink(id);
        std::cout << (rt.links.contains(id) ? "  " : "! ") << id << "  (contract " << e->contract.contract_version
                  << ", when " << e->contract.when.to_string() << ")\n";
    }
    for (const auto& id : rt.links.ids()) {
        if (!rt.registry.getLink(id)) std::cout << "? " << id << "  (implementation without manifest)\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    dawn::apply_env_defaults(dawn::detect_env());

    if (argc < 2) {
        std::cerr << "dawn_cli <run|inspect|verify-ledger|lock|prune|approve-shadow|links> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "inspect") return cmd_inspect(argc, argv);
    if (cmd == "verify-ledger") return cmd_verify_ledger(argc, argv);
    if (cmd == "lock") return cmd_lock(argc, argv);
    if (cmd == "prune") return cmd_prune(argc, argv);
    if (cmd == "approve-shadow") return cmd_approve_shadow(argc, argv);
    if (cmd == "links") return cmd_links(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
