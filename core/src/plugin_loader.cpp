#include "dawn/plugin_loader.h"
#include "dawn/config.h"
#include "dawn/crypto.h"
#include "dawn/errors.h"

#include <algorithm>
#include <cstdio>
#include <set>

#include <dlfcn.h>

namespace dawn {

namespace {

std::string hex32(uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x", v);
    return buf;
}

std::string canonical_str(const std::filesystem::path& p) {
    std::error_code ec;
    auto c = std::filesystem::weakly_canonical(p, ec);
    if (ec) return p.string();
    return c.string();
}

[[noreturn]] void reject(const std::string& canonical, const std::string& why) {
    throw PipelineError("link plugin " + canonical + ": " + why);
}

// Optional exports resolve to nullptr; dlerror() is cleared either way.
template <typename Fn>
Fn find_symbol(void* handle, const char* name) {
    dlerror();
    auto fn = reinterpret_cast<Fn>(dlsym(handle, name));
    dlerror();
    return fn;
}

// dlopen handle that is closed unless the plugin is accepted.
class Library {
public:
    explicit Library(void* h) : h_(h) {}
    ~Library() {
        if (h_) dlclose(h_);
    }
    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;

    void* get() const { return h_; }
    void* release() {
        void* h = h_;
        h_ = nullptr;
        return h;
    }

private:
    void* h_;
};

// Collects what dawn_plugin_init registers without touching the LinkTable.
class StagingRegistrar : public ILinkRegistrar {
public:
    void register_link(const char* link_id, LinkFnPtr fn) override {
        if (!link_id || !*link_id || !fn) {
            ++malformed_;
            return;
        }
        staged_.emplace_back(link_id, fn);
    }

    const std::vector<std::pair<std::string, LinkFnPtr>>& staged() const { return staged_; }
    int malformed() const { return malformed_; }

private:
    std::vector<std::pair<std::string, LinkFnPtr>> staged_;
    int malformed_{0};
};

std::string join_ids(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

} // namespace

PluginManager::PluginManager() : abi_lax_(env_flag("DAWN_PLUGIN_ABI_LAX")) {}

PluginManager::~PluginManager() {
    for (auto& p : plugins_) {
        if (p.handle) dlclose(p.handle);
    }
}

bool PluginManager::is_loaded(const std::filesystem::path& plugin) const {
    const std::string canonical = canonical_str(plugin);
    return std::any_of(plugins_.begin(), plugins_.end(),
                       [&](const LoadedPlugin& p) { return p.canonical == canonical; });
}

const std::string* PluginManager::provider_of(const std::string& link_id) const {
    auto it = providers_.find(link_id);
    return it == providers_.end() ? nullptr : &it->second;
}

void PluginManager::set_expected_hash(const std::string& canonical_path, const std::string& sha256_hex) {
    expected_hashes_[canonical_path] = sha256_hex;
}

void PluginManager::verify_pin(const std::string& canonical, const std::filesystem::path& plugin) const {
    auto it = expected_hashes_.find(canonical);
    if (it == expected_hashes_.end()) return;
    const std::string actual = sha256_hex_file(plugin);
    if (actual.empty()) reject(canonical, "cannot hash plugin file");
    if (!constant_time_eq(actual, it->second)) {
        reject(canonical, "hash mismatch: pinned=" + it->second + " actual=" + actual);
    }
}

void PluginManager::check_capabilities(const std::string& canonical, void* handle) const {
    auto caps = find_symbol<dawn_plugin_capabilities_fn>(handle, "dawn_plugin_capabilities");
    const uint32_t declared = caps ? caps() : CAP_ALL;
    const uint32_t excess = declared & ~allowed_caps_;
    if (excess != 0) {
        reject(canonical, "link capabilities exceed the allowed mask: declared=0x" + hex32(declared) +
                              " allowed=0x" + hex32(allowed_caps_) + " excess=0x" + hex32(excess));
    }
}

void PluginManager::check_abi(const std::string& canonical, void* handle) const {
    auto abi = find_symbol<dawn_plugin_abi_version_fn>(handle, "dawn_plugin_abi_version");
    if (!abi) {
        if (abi_lax_) return;
        reject(canonical, "no dawn_plugin_abi_version() export (DAWN_PLUGIN_ABI_LAX=1 accepts it)");
    }
    const int version = abi();
    if (version != DAWN_ABI_VERSION) {
        reject(canonical, "link ABI v" + std::to_string(version) + " does not match host v" +
                              std::to_string(DAWN_ABI_VERSION));
    }
}

void PluginManager::check_links(const std::string& canonical,
                                const std::vector<std::pair<std::string, LinkFnPtr>>& staged,
                                const LinkTable& table) const {
    if (staged.empty()) reject(canonical, "registered no links");
    std::set<std::string> seen;
    for (const auto& [id, fn] : staged) {
        if (!seen.insert(id).second) reject(canonical, "link " + id + " registered twice");
        if (table.contains(id)) {
            const std::string* other = provider_of(id);
            reject(canonical, "link " + id + " is already provided by " +
                                  (other ? *other : std::string("a built-in link")));
        }
        if (manifests_ && !manifests_->getLink(id)) reject(canonical, "link " + id + " has no manifest");
    }
}

std::vector<std::string> PluginManager::load_links(const std::filesystem::path& plugin, LinkTable& table) {
    const std::string canonical = canonical_str(plugin);
    if (is_loaded(plugin)) return {};

    std::error_code ec;
    if (!std::filesystem::is_regular_file(plugin, ec)) reject(canonical, "not found");
    verify_pin(canonical, plugin);

    Library lib(dlopen(plugin.string().c_str(), RTLD_NOW | RTLD_LOCAL));
    if (!lib.get()) {
        const char* dl_err = dlerror();
        reject(canonical, std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)"));
    }
    check_capabilities(canonical, lib.get());
    check_abi(canonical, lib.get());

    auto init = find_symbol<dawn_plugin_init_fn>(lib.get(), "dawn_plugin_init");
    if (!init) reject(canonical, "no dawn_plugin_init() export");

    StagingRegistrar staging;
    try {
        init(&staging);
    } catch (const std::exception& e) {
        reject(canonical, std::string("dawn_plugin_init threw: ") + e.what());
    }
    if (staging.malformed() > 0) {
        reject(canonical, std::to_string(staging.malformed()) + " registration(s) with a null link id or function");
    }
    check_links(canonical, staging.staged(), table);

    LoadedPlugin loaded;
    loaded.canonical = canonical;
    for (const auto& [id, fn] : staging.staged()) {
        table.add(id, LinkFn(fn));
        providers_[id] = canonical;
        loaded.link_ids.push_back(id);
    }
    loaded.handle = lib.release();
    plugins_.push_back(loaded);
    log_line(LogLevel::INFO, "link plugin loaded: " + canonical + " (" + join_ids(loaded.link_ids) + ")");
    return loaded.link_ids;
}

size_t PluginManager::load_links_from_dir(const std::filesystem::path& dir, LinkTable& table,
                                          std::vector<std::string>* errors) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return 0;

    std::vector<std::filesystem::path> candidates;
    for (const auto& ent : std::filesystem::directory_iterator(dir, ec)) {
        if (!ent.is_regular_file(ec)) continue;
        if (ent.path().extension() != ".so") continue;
        candidates.push_back(ent.path());
    }
    std::sort(candidates.begin(), candidates.end());

    size_t added = 0;
    for (const auto& p : candidates) {
        try {
            added += load_links(p, table).size();
        } catch (const PipelineError& e) {
            log_line(LogLevel::WARN, e.what());
            if (errors) errors->push_back(e.what());
        }
    }
    return added;
}

} // namespace dawn
