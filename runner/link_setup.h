#pragma once

#include "dawn/config.h"
#include "dawn/link_api.h"
#include "dawn/plugin_loader.h"
#include "dawn/policy.h"
#include "dawn/registry.h"

#include <filesystem>
#include <memory>

namespace dawn {

// Everything a command needs to run pipelines, owned in one place.
struct LinkRuntime {
    RuntimeConfig cfg;
    std::unique_ptr<PolicyLoader> policy;
    LinkRegistry registry;
    LinkTable links;
    PluginManager plugins;
};

// Full setup: resolve config, load the policy, discover manifests, register
// built-in links and preload plugins from DAWN_PLUGIN_DIR.
// Throws PolicyValidationError / PipelineError on a bad policy or manifest.
void setup_runtime(LinkRuntime& rt, const std::filesystem::path& root);

} // namespace dawn
