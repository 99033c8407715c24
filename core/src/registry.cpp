#include "dawn/registry.h"
#include "dawn/config.h"
#include "dawn/errors.h"
#include "dawn/policy.h"
#include "dawn/yaml_json.h"

#include <algorithm>
#include <stdexcept>

namespace dawn {

namespace {

struct CallForm {
    const char* prefix;
    WhenCondition::Kind kind;
};

constexpr CallForm kCallForms[] = {
    {"on_success(", WhenCondition::Kind::ON_SUCCESS},
    {"on_failure(", WhenCondition::Kind::ON_FAILURE},
    {"if_artifact_exists(", WhenCondition::Kind::IF_ARTIFACT_EXISTS},
};

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return s.substr(b, e - b);
}

std::vector<ArtifactRef> parse_ref_list(json_object* arr, const std::string& link_id, const char* field) {
    std::vector<ArtifactRef> out;
    if (!arr) return out;
    if (!json_mini::is_array(arr)) {
        throw PipelineError("link " + link_id + ": spec." + field + " must be a list");
    }
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        ArtifactRef r = parse_artifact_ref(json_object_array_get_idx(arr, i));
        if (r.artifact_id.empty()) {
            throw PipelineError("link " + link_id + ": spec." + field + "[" + std::to_string(i) +
                                "] has no artifact id");
        }
        out.push_back(std::move(r));
    }
    return out;
}

CoherencePolicy parse_coherence(json_object* o, const std::string& link_id) {
    CoherencePolicy cp;
    if (!json_mini::is_object(o)) {
        throw PipelineError("link " + link_id + ": coherence_policy must be a mapping");
    }
    cp.threshold = json_mini::get_number(o, "threshold").value_or(cp.threshold);
    std::string mode = json_mini::get_string(o, "on_drift").value_or("warn");
    if (mode == "fail") cp.on_drift = CoherencePolicy::OnDrift::FAIL;
    else if (mode == "warn") cp.on_drift = CoherencePolicy::OnDrift::WARN;
    else if (mode == "reflect") cp.on_drift = CoherencePolicy::OnDrift::REFLECT;
    else throw PipelineError("link " + link_id + ": unknown coherence_policy.on_drift '" + mode + "'");
    cp.artifact = json_mini::get_string(o, "artifact").value_or("");
    cp.baseline = json_mini::get_string(o, "baseline").value_or(cp.baseline);
    return cp;
}

} // namespace

WhenCondition WhenCondition::parse(const std::string& text) {
    WhenCondition c;
    std::string s = trim(text);
    if (s.empty() || s == "always") return c;

    for (const auto& form : kCallForms) {
        std::string prefix = form.prefix;
        if (s.rfind(prefix, 0) != 0) continue;
        if (s.back() != ')') break;
        std::string target = trim(s.substr(prefix.size(), s.size() - prefix.size() - 1));
        if (target.empty() || target.find_first_of("()") != std::string::npos) break;
        c.kind = form.kind;
        c.target = target;
        return c;
    }
    throw PipelineError("malformed when condition: '" + text + "'");
}

std::string WhenCondition::to_string() const {
    switch (kind) {
        case Kind::ALWAYS: return "always";
        case Kind::ON_SUCCESS: return "on_success(" + target + ")";
        case Kind::ON_FAILURE: return "on_failure(" + target + ")";
        case Kind::IF_ARTIFACT_EXISTS: return "if_artifact_exists(" + target + ")";
    }
    return "always";
}

const char* on_drift_name(CoherencePolicy::OnDrift d) {
    switch (d) {
        case CoherencePolicy::OnDrift::FAIL: return "fail";
        case CoherencePolicy::OnDrift::WARN: return "warn";
        case CoherencePolicy::OnDrift::REFLECT: return "reflect";
    }
    return "warn";
}

ArtifactRef parse_artifact_ref(json_object* v) {
    ArtifactRef r;
    if (!v) return r;
    if (json_object_is_type(v, json_type_string)) {
        r.artifact_id = json_object_get_string(v);
        return r;
    }
    if (!json_mini::is_object(v)) return r;

    r.artifact_id = json_mini::get_string(v, "artifact")
                        .value_or(json_mini::get_string(v, "artifactId").value_or(""));
    r.optional = json_mini::get_bool(v, "optional").value_or(false);
    r.from_link = json_mini::get_string(v, "from_link").value_or("");
    r.path = json_mini::get_string(v, "path").value_or("");

    json_object* schema = json_mini::get(v, "schema");
    if (schema && json_object_is_type(schema, json_type_string)) {
        r.schema_type = json_object_get_string(schema);
    } else if (json_mini::is_object(schema)) {
        r.schema_type = json_mini::get_string(schema, "type").value_or("");
        r.schema_ref = json_mini::get_string(schema, "ref").value_or("");
    }
    return r;
}

LinkContract parse_link_contract(json_object* manifest) {
    if (!json_mini::is_object(manifest)) throw PipelineError("link manifest must be a mapping");

    LinkContract c;
    c.id = json_mini::get_string(json_mini::get(manifest, "metadata"), "name").value_or("");
    if (c.id.empty()) throw PipelineError("link manifest missing metadata.name");

    c.contract_version = json_mini::get_string(manifest, "contractVersion").value_or("1.0.0");

    json_object* spec = json_mini::get(manifest, "spec");
    if (spec && !json_mini::is_object(spec)) throw PipelineError("link " + c.id + ": spec must be a mapping");

    c.requires_ = parse_ref_list(json_mini::get(spec, "requires"), c.id, "requires");
    c.produces = parse_ref_list(json_mini::get(spec, "produces"), c.id, "produces");

    auto cond = json_mini::get_string(json_mini::get(spec, "when"), "condition");
    if (cond) c.when = WhenCondition::parse(*cond);

    json_object* rt = json_mini::get(spec, "runtime");
    c.runtime.always_run = json_mini::get_bool(rt, "alwaysRun").value_or(false);
    // top-level max_wall_time_sec (pipeline overrides) wins over the runtime hint
    auto mwt = json_mini::get_int(manifest, "max_wall_time_sec");
    if (!mwt) mwt = json_mini::get_int(rt, "max_wall_time_sec");
    if (mwt && *mwt > 0) c.runtime.max_wall_time_sec = (int)std::min<int64_t>(*mwt, kMaxLinkTimeoutSec);

    json_object* coh = json_mini::get(spec, "coherence_policy");
    if (coh) c.coherence = parse_coherence(coh, c.id);
    return c;
}

void LinkRegistry::loadManifest(const std::filesystem::path& manifest_path) {
    json_mini::Doc doc;
    try {
        doc = load_yaml_file(manifest_path);
    } catch (const std::runtime_error& e) {
        throw PipelineError(e.what());
    }
    if (!doc) throw PipelineError("empty link manifest: " + manifest_path.string());

    LinkEntry e;
    e.contract = parse_link_contract(doc.root);
    e.id = e.contract.id;
    e.dir = manifest_path.parent_path();
    e.manifest = std::make_shared<const json_mini::Doc>(std::move(doc));
    registerLink(std::move(e), /*allow_override=*/false);
}

size_t LinkRegistry::discover(const std::filesystem::path& links_dir) {
    links_.clear();
    std::error_code ec;
    if (!std::filesystem::is_directory(links_dir, ec)) return 0;

    // sorted so duplicate-name errors are reproducible
    std::vector<std::filesystem::path> dirs;
    for (const auto& de : std::filesystem::directory_iterator(links_dir, ec)) {
        if (de.is_directory(ec)) dirs.push_back(de.path());
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& d : dirs) {
        auto manifest = d / "link.yaml";
        if (!std::filesystem::is_regular_file(manifest, ec)) continue;
        loadManifest(manifest);
    }
    log_line(LogLevel::INFO, "registry: " + std::to_string(links_.size()) + " links from " + links_dir.string());
    return links_.size();
}

void LinkRegistry::registerLink(LinkEntry e, bool allow_override) {
    if (e.id.empty()) throw PipelineError("cannot register a link without an id");
    auto it = links_.find(e.id);
    if (it != links_.end() && !allow_override) {
        throw PipelineError("duplicate link id in registry: " + e.id);
    }
    std::string key = e.id;
    links_[key] = std::move(e);
}

const LinkEntry* LinkRegistry::getLink(const std::string& id) const {
    auto it = links_.find(id);
    if (it == links_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> LinkRegistry::listLinks() const {
    std::vector<std::string> out;
    out.reserve(links_.size());
    for (const auto& kv : links_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace dawn
