#include "builtin_links.h"

#include "dawn/json_mini.h"

#include <stdexcept>
#include <string>

namespace dawn {

namespace {

// Reads inputs/<blueprint> and publishes it as dawn.project.ir under rel.
LinkResult publish_blueprint(LinkContext& ctx, const std::string& rel) {
    const std::string name = json_mini::get_string(ctx.config, "blueprint").value_or("blueprint.json");
    const auto path = ctx.project_root / "inputs" / name;

    std::string err;
    auto doc = json_mini::parse_file(path, &err);
    if (!doc) throw std::runtime_error("cannot read blueprint " + path.string() + ": " + err);
    if (!json_mini::is_object(doc.root)) {
        return LinkResult::failed("SCHEMA_INVALID", "blueprint " + name + " is not a JSON object");
    }

    ctx.sandbox->publish("dawn.project.ir", rel, doc.root);

    LinkResult r;
    r.metrics = json_mini::new_object();
    json_object* nodes = json_mini::get(doc.root, "nodes");
    json_mini::put_int(r.metrics.root, "nodes", json_mini::is_array(nodes) ? (int64_t)json_object_array_length(nodes) : 0);
    return r;
}

} // namespace

LinkResult link_generate_ir(LinkContext& ctx) {
    return publish_blueprint(ctx, "ir.json");
}

// Shadow candidate of logic.generate_ir; same document under another file name.
LinkResult link_generate_ir_v2(LinkContext& ctx) {
    return publish_blueprint(ctx, "ir_v2.json");
}

} // namespace dawn
