#include "dawn/sandbox.h"
#include "dawn/artifact_store.h"
#include "dawn/fs_util.h"

#include <stdexcept>

namespace dawn {

Sandbox::Sandbox(const std::filesystem::path& artifacts_dir, const std::string& link_id, ArtifactStore* store)
    : root_(artifacts_dir / link_id), link_id_(link_id), store_(store) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) throw std::runtime_error("sandbox: cannot create " + root_.string() + ": " + ec.message());
}

std::filesystem::path Sandbox::resolve(const std::string& rel) const {
    std::filesystem::path p(rel);
    if (rel.empty() || p.is_absolute()) {
        throw std::runtime_error("sandbox path must be relative: '" + rel + "'");
    }
    auto norm = p.lexically_normal();
    if (norm.empty() || *norm.begin() == "..") {
        throw std::runtime_error("sandbox path escapes link root: '" + rel + "'");
    }
    return root_ / norm;
}

std::filesystem::path Sandbox::write_json(const std::string& rel, json_object* obj) {
    auto full = resolve(rel);
    std::string err = write_file(full, json_mini::serialize_sorted(obj, 2) + "\n");
    if (!err.empty()) throw std::runtime_error("sandbox write_json: " + err);
    return full;
}

std::filesystem::path Sandbox::write_text(const std::string& rel, const std::string& text) {
    auto full = resolve(rel);
    std::string err = write_file(full, text);
    if (!err.empty()) throw std::runtime_error("sandbox write_text: " + err);
    return full;
}

std::filesystem::path Sandbox::copy_in(const std::filesystem::path& src, const std::string& rel) {
    auto full = resolve(rel);
    std::error_code ec;
    std::filesystem::create_directories(full.parent_path(), ec);
    std::filesystem::copy_file(src, full, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) throw std::runtime_error("sandbox copy_in " + src.string() + ": " + ec.message());
    return full;
}

void Sandbox::record(const std::string& artifact_id, const std::filesystem::path& path, const std::string& schema) {
    if (store_) store_->register_artifact(artifact_id, path, schema, link_id_);
    published_.push_back({artifact_id, path, schema});
}

std::filesystem::path Sandbox::publish(const std::string& artifact_id, const std::string& rel,
                                       json_object* obj, const std::string& schema) {
    auto path = write_json(rel, obj);
    record(artifact_id, path, schema);
    return path;
}

std::filesystem::path Sandbox::publish_text(const std::string& artifact_id, const std::string& rel,
                                            const std::string& text, const std::string& schema) {
    auto path = write_text(rel, text);
    record(artifact_id, path, schema);
    return path;
}

} // namespace dawn
