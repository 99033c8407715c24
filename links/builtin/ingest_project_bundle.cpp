#include "builtin_links.h"

#include "dawn/crypto.h"
#include "dawn/json_mini.h"

#include <fnmatch.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace dawn {

namespace {

// Control-plane files that never enter the bundle digest.
const char* const kDefaultExcludes[] = {
    "hitl_*.json", ".dawn_*", ".DS_Store", "Thumbs.db", "._*", "*.tmp", "*.swp",
};

bool excluded(const std::string& name, const std::string& rel, const std::vector<std::string>& globs) {
    for (const auto& g : globs) {
        if (fnmatch(g.c_str(), name.c_str(), 0) == 0 || fnmatch(g.c_str(), rel.c_str(), 0) == 0) return true;
    }
    return false;
}

struct BundleFile {
    std::string rel;
    std::string sha256;
    uint64_t bytes{0};
    std::filesystem::path abs;
};

} // namespace

// Deterministic manifest of <project>/inputs: sorted file list with
// per-file SHA-256 and a bundle digest over "path:sha256:bytes" lines.
LinkResult link_ingest_project_bundle(LinkContext& ctx) {
    const auto inputs = ctx.project_root / "inputs";
    std::error_code ec;
    if (!std::filesystem::is_directory(inputs, ec)) {
        throw std::runtime_error("Inputs directory not found: " + inputs.string());
    }

    std::vector<std::string> globs(std::begin(kDefaultExcludes), std::end(kDefaultExcludes));
    for (auto& g : json_mini::get_array_strings(ctx.config, "exclude_globs")) globs.push_back(std::move(g));

    std::vector<BundleFile> files;
    std::vector<std::string> skipped;
    for (auto it = std::filesystem::recursive_directory_iterator(inputs, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string rel = it->path().lexically_relative(inputs).generic_string();
        if (excluded(it->path().filename().string(), rel, globs)) {
            skipped.push_back(rel);
            continue;
        }
        BundleFile f;
        f.rel = rel;
        f.abs = std::filesystem::absolute(it->path());
        f.sha256 = sha256_hex_file(it->path());
        f.bytes = (uint64_t)it->file_size(ec);
        if (f.sha256.empty()) throw std::runtime_error("cannot hash input " + it->path().string());
        files.push_back(std::move(f));
    }
    if (ec) throw std::runtime_error("cannot scan " + inputs.string() + ": " + ec.message());
    std::sort(files.begin(), files.end(), [](const BundleFile& a, const BundleFile& b) { return a.rel < b.rel; });

    json_object* meta_cfg = json_mini::get(ctx.config, "meta_bundle");
    json_mini::Doc meta(json_mini::is_object(meta_cfg) ? json_mini::clone(meta_cfg) : json_object_new_object());

    std::string canonical;
    json_object* arr = json_object_new_array();
    for (const auto& f : files) {
        canonical += f.rel + ":" + f.sha256 + ":" + std::to_string(f.bytes) + "\n";
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "path", f.rel);
        json_mini::put_string(o, "uri", "file://" + f.abs.string());
        json_mini::put_int(o, "bytes", (int64_t)f.bytes);
        json_mini::put_string(o, "sha256", f.sha256);
        json_object_array_add(arr, o);
    }
    canonical += "meta:" + sha256_hex(json_mini::canonical(meta.root));
    const std::string bundle_sha = sha256_hex(canonical);

    auto manifest = json_mini::new_object();
    json_mini::put_string(manifest.root, "schema_version", "1.1.0");
    json_mini::put_string(manifest.root, "bundle_sha256", bundle_sha);
    json_mini::put_string(manifest.root, "root", "inputs");
    json_mini::put(manifest.root, "files", arr);
    json_mini::put(manifest.root, "meta_bundle", meta.release());

    ctx.sandbox->publish("dawn.project.bundle", "dawn.project.bundle.json", manifest.root);

    LinkResult r;
    r.metrics = json_mini::new_object();
    json_mini::put_int(r.metrics.root, "files_bundled", (int64_t)files.size());
    json_mini::put_int(r.metrics.root, "files_excluded", (int64_t)skipped.size());
    json_mini::put_string(r.metrics.root, "bundle_sha256", bundle_sha);
    return r;
}

} // namespace dawn
