#include "dawn/artifact_store.h"
#include "dawn/config.h"
#include "dawn/crypto.h"
#include "dawn/fs_util.h"

#include <stdexcept>

namespace dawn {

json_mini::Doc ArtifactRecord::to_json() const {
    auto o = json_mini::new_object();
    json_mini::put_string(o.root, "path", path.string());
    json_mini::put_string(o.root, "digest", digest);
    json_mini::put_string(o.root, "schema", schema);
    json_mini::put_string(o.root, "producer_link_id", producer_link_id);
    if (!blob_uri.empty()) json_mini::put_string(o.root, "blob_uri", blob_uri);
    return o;
}

std::optional<ArtifactRecord> ArtifactRecord::from_json(const std::string& artifact_id, json_object* o) {
    if (!json_mini::is_object(o)) return std::nullopt;
    auto p = json_mini::get_string(o, "path");
    if (!p || p->empty()) return std::nullopt;
    ArtifactRecord r;
    r.artifact_id = artifact_id;
    r.path = *p;
    r.digest = json_mini::get_string(o, "digest").value_or("");
    r.schema = json_mini::get_string(o, "schema").value_or("");
    r.producer_link_id = json_mini::get_string(o, "producer_link_id").value_or("");
    r.blob_uri = json_mini::get_string(o, "blob_uri").value_or("");
    return r;
}

ArtifactStore::ArtifactStore(std::filesystem::path project_root, std::filesystem::path artifacts_dir)
    : project_root_(std::move(project_root)),
      artifacts_dir_(artifacts_dir.empty() ? project_root_ / "artifacts" : std::move(artifacts_dir)) {
    std::error_code ec;
    std::filesystem::create_directories(artifacts_dir_, ec);
    if (ec) throw std::runtime_error("artifact store: cannot create " + artifacts_dir_.string() + ": " + ec.message());
}

std::string ArtifactStore::get_digest(const std::filesystem::path& path) {
    std::string d = sha256_hex_file(path);
    if (d.empty()) throw std::runtime_error("cannot digest: " + path.string());
    return d;
}

const ArtifactRecord& ArtifactStore::register_artifact(const std::string& artifact_id,
                                                       const std::filesystem::path& path,
                                                       const std::string& schema,
                                                       const std::string& producer_link_id,
                                                       const std::string& blob_uri) {
    if (artifact_id.empty()) throw std::runtime_error("register: empty artifact id");
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    if (ec) abs = path;
    if (!std::filesystem::is_regular_file(abs, ec)) {
        throw std::runtime_error("register " + artifact_id + ": file does not exist: " + abs.string());
    }

    ArtifactRecord r;
    r.artifact_id = artifact_id;
    r.path = abs.lexically_normal();
    r.digest = get_digest(abs);
    r.schema = schema;
    r.producer_link_id = producer_link_id;
    r.blob_uri = blob_uri;
    auto& slot = records_[artifact_id];
    slot = std::move(r);
    return slot;
}

const ArtifactRecord* ArtifactStore::get(const std::string& artifact_id) const {
    auto it = records_.find(artifact_id);
    if (it == records_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> ArtifactStore::list_artifacts() const {
    std::vector<std::string> out;
    for (const auto& kv : records_) out.push_back(kv.first);
    return out;
}

std::vector<ArtifactRecord> ArtifactStore::records_for_link(const std::string& link_id) const {
    std::vector<ArtifactRecord> out;
    for (const auto& kv : records_) {
        if (kv.second.producer_link_id == link_id) out.push_back(kv.second);
    }
    return out;
}

void ArtifactStore::forget_link(const std::string& link_id) {
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.producer_link_id == link_id) it = records_.erase(it);
        else ++it;
    }
}

std::filesystem::path ArtifactStore::link_dir(const std::string& link_id) const {
    auto d = artifacts_dir_ / link_id;
    std::error_code ec;
    std::filesystem::create_directories(d, ec);
    if (ec) throw std::runtime_error("cannot create link dir " + d.string() + ": " + ec.message());
    return d;
}

std::string ArtifactStore::save_manifest(const std::string& link_id) const {
    auto manifest = json_mini::new_object();
    for (const auto& rec : records_for_link(link_id)) {
        json_mini::put(manifest.root, rec.artifact_id.c_str(), rec.to_json().release());
    }
    return write_atomic(link_dir(link_id) / kManifestName, json_mini::serialize_sorted(manifest.root, 2) + "\n");
}

int ArtifactStore::rehydrate_from_link_dir(const std::string& link_id) {
    auto manifest_path = artifacts_dir_ / link_id / kManifestName;
    std::error_code ec;
    if (!std::filesystem::exists(manifest_path, ec)) return 0;

    std::string err;
    auto doc = json_mini::parse_file(manifest_path, &err);
    if (!json_mini::is_object(doc.root)) {
        log_line(LogLevel::WARN, "artifact manifest unreadable: " + manifest_path.string() +
                                     (err.empty() ? "" : " (" + err + ")"));
        return 0;
    }

    int count = 0;
    json_object_object_foreach(doc.root, aid, meta) {
        auto rec = ArtifactRecord::from_json(aid, meta);
        if (!rec) continue;
        if (!std::filesystem::is_regular_file(rec->path, ec)) continue;
        std::string actual = sha256_hex_file(rec->path);
        if (actual.empty() || !constant_time_eq(actual, rec->digest)) {
            log_line(LogLevel::WARN, "rehydrate " + std::string(aid) + ": digest changed on disk, not reused");
            continue;
        }
        records_[aid] = std::move(*rec);
        count++;
    }
    return count;
}

json_mini::Doc load_artifact_index(const std::filesystem::path& project_root) {
    auto path = project_root / "artifact_index.json";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return json_mini::new_object();
    std::string err;
    auto doc = json_mini::parse_file(path, &err);
    if (!json_mini::is_object(doc.root)) {
        log_line(LogLevel::WARN, "artifact index unreadable, starting empty: " + path.string() +
                                     (err.empty() ? "" : " (" + err + ")"));
        return json_mini::new_object();
    }
    return doc;
}

std::string save_artifact_index(const std::filesystem::path& project_root, json_object* index) {
    return write_atomic(project_root / "artifact_index.json", json_mini::serialize_sorted(index, 2) + "\n");
}

json_mini::Doc index_entry(const ArtifactRecord& rec, const std::string& run_id) {
    auto o = json_mini::new_object();
    json_mini::put_string(o.root, "path", rec.path.string());
    json_mini::put_string(o.root, "digest", rec.digest);
    json_mini::put_string(o.root, "link_id", rec.producer_link_id);
    json_mini::put_string(o.root, "run_id", run_id);
    json_mini::put_string(o.root, "created_at", iso_utc_now());
    return o;
}

} // namespace dawn
