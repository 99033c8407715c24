#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "dawn/link_api.h"
#include "dawn/registry.h"

namespace dawn {

// Loads link plugins: shared libraries exporting dawn_plugin_init(...).
// Links a plugin registers are staged first and only enter the LinkTable
// once the whole plugin is accepted, so a rejected plugin leaves no links
// behind. Accepted plugins stay mapped for the process lifetime.
class PluginManager {
public:
    PluginManager();
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    // Loads one plugin and adds its links to table. Returns the link ids
    // added, empty if the plugin was already loaded.
    // Throws PipelineError("link plugin <path>: ...") when it is rejected.
    std::vector<std::string> load_links(const std::filesystem::path& plugin, LinkTable& table);

    // Loads every not-yet-loaded .so in dir (non-recursive, sorted). A
    // rejected plugin is logged and its message appended to errors; the
    // rest still load. Returns the number of links added.
    size_t load_links_from_dir(const std::filesystem::path& dir, LinkTable& table,
                               std::vector<std::string>* errors = nullptr);

    // When set, a plugin may only provide links that have a manifest here.
    void set_manifest_registry(const LinkRegistry* registry) { manifests_ = registry; }

    bool is_loaded(const std::filesystem::path& plugin) const;
    size_t loaded_count() const { return plugins_.size(); }

    // Canonical path of the plugin that provided link_id; nullptr for
    // links that did not come from a plugin.
    const std::string* provider_of(const std::string& link_id) const;

    // Optional SHA-256 pin, verified before dlopen.
    void set_expected_hash(const std::string& canonical_path, const std::string& sha256_hex);

    // Plugins declaring capabilities beyond this mask are rejected. Default: CAP_ALL.
    void set_allowed_capabilities(uint32_t cap_mask) { allowed_caps_ = cap_mask; }
    uint32_t allowed_capabilities() const { return allowed_caps_; }

    // Accept plugins without dawn_plugin_abi_version(). Default: DAWN_PLUGIN_ABI_LAX.
    void set_abi_lax(bool lax) { abi_lax_ = lax; }

private:
    struct LoadedPlugin {
        std::string canonical;
        void* handle{nullptr};
        std::vector<std::string> link_ids;
    };

    void verify_pin(const std::string& canonical, const std::filesystem::path& plugin) const;
    void check_capabilities(const std::string& canonical, void* handle) const;
    void check_abi(const std::string& canonical, void* handle) const;
    void check_links(const std::string& canonical,
                     const std::vector<std::pair<std::string, LinkFnPtr>>& staged,
                     const LinkTable& table) const;

    std::vector<LoadedPlugin> plugins_;
    std::unordered_map<std::string, std::string> providers_;  // link id -> plugin
    std::unordered_map<std::string, std::string> expected_hashes_;
    const LinkRegistry* manifests_{nullptr};
    uint32_t allowed_caps_{CAP_ALL};
    bool abi_lax_{false};
};

} // namespace dawn
