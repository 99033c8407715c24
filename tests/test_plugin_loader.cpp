#include "test_common.h"

#include "dawn/artifact_store.h"
#include "dawn/crypto.h"
#include "dawn/errors.h"
#include "dawn/plugin_loader.h"
#include "dawn/registry.h"
#include "dawn/sandbox.h"

using namespace dawn;
namespace fs = std::filesystem;

#ifndef DAWN_TEST_PLUGIN_PATH
#error "DAWN_TEST_PLUGIN_PATH must point at the built test plugin"
#endif

namespace {

// Message of the PipelineError a rejected load throws; empty if it loaded.
std::string load_error(PluginManager& pm, const fs::path& plugin, LinkTable& table) {
    try {
        pm.load_links(plugin, table);
    } catch (const PipelineError& e) {
        return e.what();
    }
    return "";
}

} // namespace

int main() {
    setenv("DAWN_LOG_LEVEL", "error", 1);
    const fs::path plugin = DAWN_TEST_PLUGIN_PATH;
    expect_true(fs::exists(plugin), "test plugin built");
    const std::string canonical = fs::weakly_canonical(plugin).string();

    auto root = fresh_dir("dawn_test_plugin_loader");

    // Test 1: load, register, run the plugin link.
    {
        PluginManager pm;
        LinkTable table;
        auto ids = pm.load_links(plugin, table);
        expect_eq_ll((long long)ids.size(), 1, "one link registered");
        expect_eq_str(ids[0], "plugin.echo", "registered id");
        expect_true(pm.is_loaded(plugin), "tracked as loaded");
        expect_true(pm.provider_of("plugin.echo") != nullptr, "provider recorded");
        expect_eq_str(*pm.provider_of("plugin.echo"), canonical, "provider is the plugin path");
        expect_true(pm.load_links(plugin, table).empty(), "second load is a no-op");
        expect_eq_ll((long long)pm.loaded_count(), 1, "loaded once");

        const LinkFn* fn = table.find("plugin.echo");
        expect_true(fn != nullptr, "link callable through the table");

        ArtifactStore store(root);
        Sandbox sb(store.artifacts_dir(), "plugin.echo", &store);
        auto cfg = json_mini::new_object();
        json_mini::put_string(cfg.root, "message", "from config");
        LinkContext ctx;
        ctx.link_id = "plugin.echo";
        ctx.project_root = root;
        ctx.config = cfg.root;
        ctx.sandbox = &sb;
        LinkResult r = (*fn)(ctx);
        expect_eq_str(r.status, "SUCCEEDED", "plugin result");
        expect_eq_ll(json_mini::get_int(r.metrics.root, "echoed").value_or(0), 1, "plugin metrics");
        const ArtifactRecord* rec = store.get("plugin.echo.out");
        expect_true(rec != nullptr, "plugin output registered");
        auto doc = json_mini::parse_file(rec->path);
        expect_eq_str(json_mini::get_string(doc.root, "echo").value_or(""), "from config", "config reached plugin");
    }

    // Test 2: capability mask.
    {
        PluginManager pm;
        pm.set_allowed_capabilities(CAP_FILE_READ);
        LinkTable table;
        std::string err = load_error(pm, plugin, table);
        expect_true(err.find("link plugin " + canonical) == 0, "error names the plugin: " + err);
        expect_true(err.find("capabilities exceed") != std::string::npos, "capability error: " + err);
        expect_true(table.ids().empty(), "nothing registered");
        expect_true(!pm.is_loaded(plugin), "rejected plugin not tracked");
    }

    // Test 3: hash pin.
    {
        PluginManager pm;
        LinkTable table;
        pm.set_expected_hash(canonical, std::string(64, '0'));
        std::string err = load_error(pm, plugin, table);
        expect_true(err.find("hash mismatch") != std::string::npos, "hash error: " + err);
        expect_true(!table.contains("plugin.echo"), "pinned-out link absent");

        pm.set_expected_hash(canonical, sha256_hex_file(plugin));
        expect_eq_ll((long long)pm.load_links(plugin, table).size(), 1, "correct pin accepted");
    }

    // Test 4: bad inputs.
    {
        PluginManager pm;
        LinkTable table;
        std::string err = load_error(pm, root / "missing.so", table);
        expect_true(err.find("not found") != std::string::npos, "not found error: " + err);

        write_text(root / "garbage.so", "not an elf");
        err = load_error(pm, root / "garbage.so", table);
        expect_true(err.find("dlopen failed") != std::string::npos, "dlopen error: " + err);
        expect_eq_ll((long long)pm.loaded_count(), 0, "nothing loaded");
    }

    // Test 5: a link id that is already implemented is not replaced.
    {
        PluginManager pm;
        LinkTable table;
        table.add("plugin.echo", [](LinkContext&) { return LinkResult{}; });
        std::string err = load_error(pm, plugin, table);
        expect_true(err.find("link plugin.echo is already provided by a built-in link") != std::string::npos,
                    "conflict error: " + err);
        expect_true(!pm.is_loaded(plugin), "conflicting plugin not tracked");
        expect_true(pm.provider_of("plugin.echo") == nullptr, "built-in keeps the id");
    }

    // Test 6: with a manifest registry, plugin links need a manifest.
    {
        const auto links_dir = root / "links";
        write_link_manifest(links_dir, "other.link", "  produces:\n    - artifact: other.out\n      schema: json\n");
        LinkRegistry registry;
        registry.discover(links_dir);

        PluginManager pm;
        pm.set_manifest_registry(&registry);
        LinkTable table;
        std::string err = load_error(pm, plugin, table);
        expect_true(err.find("link plugin.echo has no manifest") != std::string::npos, "manifest error: " + err);
        expect_true(table.ids().empty(), "unmanifested link not registered");

        write_link_manifest(links_dir, "plugin.echo", "  produces:\n    - artifact: plugin.echo.out\n      schema: json\n");
        registry.discover(links_dir);
        expect_eq_ll((long long)pm.load_links(plugin, table).size(), 1, "manifested link accepted");
    }

    // Test 7: directory scan loads valid plugins and collects the rejected ones.
    {
        const auto dir = root / "plugins";
        fs::create_directories(dir);
        fs::copy_file(plugin, dir / "b_echo.so");
        write_text(dir / "a_broken.so", "nope");
        write_text(dir / "readme.txt", "ignored");

        PluginManager pm;
        LinkTable table;
        std::vector<std::string> rejected;
        expect_eq_ll((long long)pm.load_links_from_dir(dir, table, &rejected), 1, "one link loaded");
        expect_eq_ll((long long)rejected.size(), 1, "one plugin rejected");
        expect_true(rejected[0].find("a_broken.so") != std::string::npos, "rejection names the file");
        expect_true(rejected[0].find("dlopen failed") != std::string::npos, "rejection reason");
        expect_true(table.contains("plugin.echo"), "scanned plugin registered");

        rejected.clear();
        expect_eq_ll((long long)pm.load_links_from_dir(dir, table, &rejected), 0, "already loaded plugins skipped");
        expect_eq_ll((long long)rejected.size(), 1, "broken plugin still reported");
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    std::cerr << "test_plugin_loader: ALL PASSED" << std::endl;
    return 0;
}
