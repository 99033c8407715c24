#pragma once

// Link ABI (v1).
//
// A link is a C++ function that receives a LinkContext and returns a
// LinkResult. Built-in links are registered statically; out-of-tree links
// are shared objects that call back into the host through ILinkRegistrar,
// so they never need to link against dawn_core symbols. Everything a link
// may touch is reachable from the context struct; file output goes through
// the ILinkSandbox interface.

#include "dawn/json_mini.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

// Plugins compiled for prod mode must export dawn_plugin_abi_version()
// returning this value.
#define DAWN_ABI_VERSION 1

namespace dawn {

class PolicyLoader;

// What a plugin declares it needs. The host rejects plugins asking for more
// than the loader allows.
enum LinkCap : uint32_t {
    CAP_NONE       = 0,
    CAP_FILE_READ  = 1u << 0,   // read files under the project root
    CAP_FILE_WRITE = 1u << 1,   // write through the sandbox
    CAP_SUBPROCESS = 1u << 2,   // spawn policy-allowed subprocess commands
    CAP_NETWORK    = 1u << 3,
    CAP_ALL        = 0xFFFFFFFFu,
};

// Per-link write facade rooted at artifacts/<link_id>/ (or the shadow root).
class ILinkSandbox {
public:
    virtual ~ILinkSandbox() = default;

    virtual const std::filesystem::path& root() const = 0;

    // All rel paths are relative to root(); ".." escapes are rejected.
    // Each call returns the absolute path written and throws std::runtime_error on failure.
    virtual std::filesystem::path write_json(const std::string& rel, json_object* obj) = 0;
    virtual std::filesystem::path write_text(const std::string& rel, const std::string& text) = 0;
    virtual std::filesystem::path copy_in(const std::filesystem::path& src, const std::string& rel) = 0;

    // Write and register as artifact_id in one call.
    virtual std::filesystem::path publish(const std::string& artifact_id, const std::string& rel,
                                          json_object* obj, const std::string& schema = "json") = 0;
    virtual std::filesystem::path publish_text(const std::string& artifact_id, const std::string& rel,
                                               const std::string& text, const std::string& schema = "text") = 0;
};

// Versioned execution context handed to every link. Borrowed pointers are
// valid only for the duration of the call.
struct LinkContext {
    uint32_t abi_version{DAWN_ABI_VERSION};

    std::string project_id;
    std::string pipeline_id;
    std::string pipeline_run_id;
    std::string link_run_id;
    std::string link_id;
    std::string worker_id;
    std::string profile;
    std::filesystem::path project_root;

    // Merged link config (manifest `config` plus pipeline overrides).
    json_object* config{nullptr};
    // artifact id -> absolute path of every artifact known at start.
    std::map<std::string, std::filesystem::path> artifacts;
    // Commands the active profile allows links to spawn.
    std::vector<std::string> allowed_subprocess_commands;

    ILinkSandbox* sandbox{nullptr};
    const PolicyLoader* policy{nullptr};
};

struct LinkResult {
    std::string status{"SUCCEEDED"};   // SUCCEEDED | FAILED
    json_mini::Doc metrics;            // object or empty
    json_mini::Doc errors;             // {type, message, ...} on FAILED

    static LinkResult ok() { return LinkResult{}; }
    static LinkResult failed(const std::string& type, const std::string& message) {
        LinkResult r;
        r.status = "FAILED";
        r.errors = json_mini::new_object();
        json_mini::put_string(r.errors.root, "type", type);
        json_mini::put_string(r.errors.root, "message", message);
        return r;
    }
};

using LinkFn = std::function<LinkResult(LinkContext&)>;

// Function pointer form of LinkFn. The host wraps it into std::function.
using LinkFnPtr = LinkResult (*)(LinkContext& ctx);

// id -> implementation.
class LinkTable {
public:
    // Duplicate ids throw unless allow_override is set.
    void add(const std::string& link_id, LinkFn fn, bool allow_override = false);
    const LinkFn* find(const std::string& link_id) const;
    bool contains(const std::string& link_id) const { return fns_.count(link_id) != 0; }
    std::vector<std::string> ids() const;

private:
    std::map<std::string, LinkFn> fns_;
};

// Host callback interface. Plugins call register_link(...) from their
// exported init function.
struct ILinkRegistrar {
    virtual ~ILinkRegistrar() = default;
    virtual void register_link(const char* link_id, LinkFnPtr fn) = 0;
};

} // namespace dawn

// Plugin entry point. A plugin must export a function with C linkage:
//   extern "C" void dawn_plugin_init(dawn::ILinkRegistrar* host);
//
// Optional ABI version export (required when DAWN_PLUGIN_ABI_LAX=0):
//   extern "C" int dawn_plugin_abi_version();
//
// Optional capability declaration; bitwise OR of dawn::LinkCap.
// If not exported, the host assumes CAP_ALL.
//   extern "C" uint32_t dawn_plugin_capabilities();
extern "C" {
    typedef void (*dawn_plugin_init_fn)(dawn::ILinkRegistrar* host);
    typedef int (*dawn_plugin_abi_version_fn)();
    typedef uint32_t (*dawn_plugin_capabilities_fn)();
}
