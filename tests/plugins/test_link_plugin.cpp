#include "dawn/link_api.h"

// Built as a MODULE against json-c only; nothing here may call into dawn_core.

using namespace dawn;

static LinkResult echo_link(LinkContext& ctx) {
    const char* message = "hello";
    json_object* v = nullptr;
    if (ctx.config && json_object_object_get_ex(ctx.config, "message", &v) &&
        json_object_is_type(v, json_type_string)) {
        message = json_object_get_string(v);
    }

    json_object* out = json_object_new_object();
    json_object_object_add(out, "echo", json_object_new_string(message));
    json_object_object_add(out, "link_id", json_object_new_string(ctx.link_id.c_str()));
    ctx.sandbox->publish("plugin.echo.out", "echo.json", out);
    json_object_put(out);

    LinkResult r;
    r.metrics = json_mini::Doc(json_object_new_object());
    json_object_object_add(r.metrics.root, "echoed", json_object_new_int(1));
    return r;
}

extern "C" void dawn_plugin_init(ILinkRegistrar* host) {
    host->register_link("plugin.echo", &echo_link);
}

extern "C" int dawn_plugin_abi_version() { return DAWN_ABI_VERSION; }

extern "C" uint32_t dawn_plugin_capabilities() { return CAP_FILE_READ | CAP_FILE_WRITE; }
