#include "link_setup.h"
#include "builtin_links.h"

#include <string>
#include <vector>

namespace dawn {

void setup_runtime(LinkRuntime& rt, const std::filesystem::path& root) {
    rt.cfg = load_runtime_config(root);

    rt.policy = std::make_unique<PolicyLoader>(rt.cfg.policy_path);
    rt.policy->load();

    rt.registry.discover(rt.cfg.links_dir);
    register_builtin_links(rt.links);

    // Out-of-tree links. A rejected plugin is reported, the rest still load.
    if (!rt.cfg.plugin_dir.empty()) {
        rt.plugins.set_abi_lax(rt.cfg.plugin_abi_lax);
        rt.plugins.set_manifest_registry(&rt.registry);
        std::vector<std::string> rejected;
        size_t n = rt.plugins.load_links_from_dir(rt.cfg.plugin_dir, rt.links, &rejected);
        if (n) log_line(LogLevel::INFO, "loaded " + std::to_string(n) + " plugin link(s) from " + rt.cfg.plugin_dir.string());
        if (!rejected.empty()) {
            log_line(LogLevel::WARN, std::to_string(rejected.size()) + " link plugin(s) rejected");
        }
    }

    // Manifests without code are only an error once a pipeline uses them.
    for (const auto& id : rt.registry.listLinks()) {
        if (!rt.links.contains(id)) log_line(LogLevel::WARN, "link " + id + " has a manifest but no implementation");
    }
}

} // namespace dawn
