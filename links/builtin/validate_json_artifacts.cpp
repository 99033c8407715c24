#include "builtin_links.h"

#include "dawn/fs_util.h"
#include "dawn/json_mini.h"

#include <string>

namespace dawn {

// Boundary check of JSON artifacts listed in config.artifacts_to_validate:
// each must parse, be an object and (unless disabled) carry schema_version.
// Artifacts that are not known yet are skipped.
LinkResult link_validate_json_artifacts(LinkContext& ctx) {
    const auto ids = json_mini::get_array_strings(ctx.config, "artifacts_to_validate");
    const bool need_version = json_mini::get_bool(ctx.config, "enforce_schema_version").value_or(true);
    const bool need_generator = json_mini::get_bool(ctx.config, "enforce_generator_id").value_or(false);
    const bool allow_envelope = json_mini::get_bool(ctx.config, "allow_enveloped_payloads").value_or(false);

    auto report = json_mini::new_object();
    json_object* results = json_object_new_array();
    json_mini::put(report.root, "artifacts", results);

    int validated = 0;
    int skipped = 0;
    for (const auto& id : ids) {
        auto it = ctx.artifacts.find(id);
        std::error_code ec;
        if (it == ctx.artifacts.end() || !std::filesystem::exists(it->second, ec)) {
            skipped++;
            continue;
        }
        const auto& path = it->second;

        auto fail = [&](const std::string& why) {
            LinkResult r = LinkResult::failed("SCHEMA_INVALID", "JSON validation failed for " + id + " (" +
                                                                    path.string() + "): " + why);
            json_mini::put_string(r.errors.root, "artifact_id", id);
            return r;
        };

        std::string err;
        auto doc = json_mini::parse_file(path, &err);
        if (!doc) return fail("Invalid JSON: " + err);
        if (!json_mini::is_object(doc.root)) return fail("Expected object at top level");

        const bool enveloped = allow_envelope && json_mini::get(doc.root, "payload") &&
                               json_mini::get(doc.root, "format");
        json_object* target = enveloped ? json_mini::get(doc.root, "payload") : doc.root;

        if (need_version && !json_mini::get(doc.root, "schema_version")) {
            return fail("Missing required field: schema_version");
        }
        if (need_generator && !json_mini::get(target, "generator_id") && !json_mini::get(target, "generated_by")) {
            return fail("Missing required field: generator_id or generated_by");
        }

        json_object* o = json_object_new_object();
        json_mini::put_string(o, "artifact_id", id);
        json_mini::put_string(o, "path", path.string());
        json_mini::put_string(o, "status", "valid");
        json_mini::put_string(o, "schema_version", json_mini::get_string(doc.root, "schema_version").value_or(""));
        json_mini::put_bool(o, "enveloped", enveloped);
        json_mini::put_int(o, "size_bytes", (int64_t)std::filesystem::file_size(path, ec));
        json_object_array_add(results, o);
        validated++;
    }

    json_mini::put_string(report.root, "generated_at", iso_utc_now());
    json_mini::put_int(report.root, "validated", validated);
    json_mini::put_int(report.root, "skipped", skipped);
    ctx.sandbox->publish("dawn.validation.json_artifacts", "validation_report.json", report.root);

    LinkResult r;
    r.metrics = json_mini::new_object();
    json_mini::put_int(r.metrics.root, "validated", validated);
    json_mini::put_int(r.metrics.root, "skipped", skipped);
    return r;
}

} // namespace dawn
