#include "dawn/pipeline.h"
#include "dawn/crypto.h"
#include "dawn/errors.h"
#include "dawn/yaml_json.h"

namespace dawn {

namespace {

std::shared_ptr<const json_mini::Doc> share_clone(json_object* o) {
    if (!o) return nullptr;
    return std::make_shared<const json_mini::Doc>(json_mini::clone(o));
}

ShadowSpec parse_shadow(json_object* v, const std::string& stable) {
    ShadowSpec s;
    if (json_object_is_type(v, json_type_string)) {
        s.link = json_object_get_string(v);
    } else if (json_mini::is_object(v)) {
        s.link = json_mini::get_string(v, "link").value_or("");
        s.parity_threshold = json_mini::get_number(v, "parity_threshold").value_or(s.parity_threshold);
    }
    if (s.link.empty()) throw PipelineError("pipeline entry " + stable + ": shadow needs a link id");
    if (s.link == stable) throw PipelineError("pipeline entry " + stable + ": a link cannot shadow itself");
    if (s.parity_threshold < 0.0 || s.parity_threshold > 1.0) {
        throw PipelineError("pipeline entry " + stable + ": parity_threshold must be within [0, 1]");
    }
    return s;
}

} // namespace

json_object* PipelineSpec::overrides_for(const std::string& link_id) const {
    if (!overrides) return nullptr;
    return json_mini::get(overrides->root, link_id.c_str());
}

PipelineSpec parse_pipeline_spec(json_object* doc) {
    if (!json_mini::is_object(doc)) throw PipelineError("pipeline document must be a mapping");

    PipelineSpec p;
    p.pipeline_id = json_mini::get_string(doc, "pipelineId").value_or("default");
    p.shadow_parity_window = (int)json_mini::get_int(doc, "shadow_parity_window").value_or(3);
    if (p.shadow_parity_window < 1) throw PipelineError("shadow_parity_window must be >= 1");

    json_object* ov = json_mini::get(doc, "overrides");
    if (ov && !json_mini::is_object(ov)) throw PipelineError("pipeline overrides must be a mapping");
    p.overrides = share_clone(ov);

    json_object* links = json_mini::get(doc, "links");
    if (links && !json_mini::is_array(links)) throw PipelineError("pipeline links must be a list");
    const size_t n = links ? json_object_array_length(links) : 0;
    for (size_t i = 0; i < n; i++) {
        json_object* item = json_object_array_get_idx(links, i);
        PipelineEntry e;
        if (item && json_object_is_type(item, json_type_string)) {
            e.id = json_object_get_string(item);
        } else if (json_mini::is_object(item)) {
            e.id = json_mini::get_string(item, "id").value_or("");
            json_object* cfg = json_mini::get(item, "config");
            json_object* eov = json_mini::get(item, "overrides");
            if (cfg && !json_mini::is_object(cfg)) throw PipelineError("pipeline entry " + e.id + ": config must be a mapping");
            if (eov && !json_mini::is_object(eov)) throw PipelineError("pipeline entry " + e.id + ": overrides must be a mapping");
            e.config = share_clone(cfg);
            e.overrides = share_clone(eov);
            if (json_object* sh = json_mini::get(item, "shadow")) e.shadow = parse_shadow(sh, e.id);
        }
        if (e.id.empty()) throw PipelineError("pipeline links[" + std::to_string(i) + "] has no id");
        p.links.push_back(std::move(e));
    }

    p.document = share_clone(doc);
    return p;
}

PipelineSpec load_pipeline_spec(const std::filesystem::path& path) {
    json_mini::Doc doc;
    try {
        doc = load_yaml_file(path);
    } catch (const std::runtime_error& e) {
        throw PipelineError(e.what());
    }
    if (!doc) throw PipelineError("empty pipeline file: " + path.string());

    PipelineSpec p = parse_pipeline_spec(doc.root);
    p.path = path;
    p.digest = sha256_hex_file(path);
    return p;
}

} // namespace dawn
