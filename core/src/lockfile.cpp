#include "dawn/lockfile.h"
#include "dawn/artifact_store.h"
#include "dawn/crypto.h"
#include "dawn/errors.h"
#include "dawn/fs_util.h"
#include "dawn/yaml_json.h"

#include <sys/utsname.h>
#include <unistd.h>

#include <set>
#include <stdexcept>

namespace dawn {

namespace {

std::string platform_identity() {
    struct utsname u {};
    if (uname(&u) != 0) return "unknown";
    return std::string(u.sysname) + "-" + u.release + "-" + u.machine;
}

std::string hostname() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) return "localhost";
    return host;
}

std::string field_or(json_object* o, const char* section, const char* key) {
    return json_mini::get_string(json_mini::get(o, section), key).value_or("(missing)");
}

} // namespace

std::string compiler_identity() {
#if defined(__clang__)
    return "clang " __clang_version__;
#elif defined(__GNUC__)
    return "gcc " __VERSION__;
#else
    return "unknown";
#endif
}

Lockfile::Lockfile(const PolicyLoader& policy, std::filesystem::path projects_dir, std::filesystem::path links_dir)
    : policy_(policy), projects_dir_(std::move(projects_dir)), links_dir_(std::move(links_dir)) {}

std::filesystem::path Lockfile::project_root(const std::string& project_id) const {
    return projects_dir_ / project_id;
}

json_mini::Doc Lockfile::generate(const std::string& project_id) const {
    const auto root = project_root(project_id);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) throw PipelineError("Project not found: " + project_id);

    auto lock = json_mini::new_object();
    json_mini::put_string(lock.root, "lockfile_version", kLockfileVersion);
    json_mini::put_string(lock.root, "generated_at", iso_utc_now());
    json_mini::put_string(lock.root, "project_id", project_id);

    json_object* pol = json_object_new_object();
    json_mini::put_string(pol, "version", policy_.version());
    json_mini::put_string(pol, "digest", policy_.digest());
    json_mini::put_string(pol, "path", policy_.path().string());
    json_mini::put(lock.root, "policy", pol);

    // Pipeline and the manifests it references.
    json_object* pipe = json_object_new_object();
    json_object* links = json_object_new_object();
    const auto pipeline_path = root / "pipeline.yaml";
    if (!std::filesystem::exists(pipeline_path, ec)) {
        json_mini::put_string(pipe, "error", "pipeline.yaml not found");
    } else {
        json_mini::Doc doc;
        try {
            doc = load_yaml_file(pipeline_path);
        } catch (const std::runtime_error& e) {
            json_mini::put_string(pipe, "error", e.what());
        }
        json_mini::put_string(pipe, "path", pipeline_path.string());
        json_mini::put_string(pipe, "digest", sha256_hex_file(pipeline_path));
        json_mini::put_string(pipe, "pipeline_id", json_mini::get_string(doc.root, "pipelineId").value_or("unknown"));

        json_object* arr = json_mini::get(doc.root, "links");
        const size_t n = json_mini::is_array(arr) ? json_object_array_length(arr) : 0;
        json_mini::put_int(pipe, "link_count", (int64_t)n);
        for (size_t i = 0; i < n; i++) {
            json_object* item = json_object_array_get_idx(arr, i);
            std::string id = json_object_is_type(item, json_type_string)
                ? json_object_get_string(item)
                : json_mini::get_string(item, "id").value_or("");
            if (id.empty()) continue;

            json_object* entry = json_object_new_object();
            const auto manifest = links_dir_ / id / "link.yaml";
            if (std::filesystem::exists(manifest, ec)) {
                json_mini::put_string(entry, "path", manifest.string());
                json_mini::put_string(entry, "digest", sha256_hex_file(manifest));
            } else {
                json_mini::put_string(entry, "error", "link.yaml not found");
            }
            json_mini::put(links, id.c_str(), entry);
        }
    }
    json_mini::put(lock.root, "pipeline", pipe);
    json_mini::put(lock.root, "links", links);

    json_object* env = json_object_new_object();
    json_mini::put_string(env, "compiler", compiler_identity());
    json_mini::put_string(env, "platform", platform_identity());
    json_mini::put_string(env, "hostname", hostname());
    json_mini::put_string(env, "cplusplus", std::to_string((long long)__cplusplus));
    json_mini::put(lock.root, "environment", env);

    json_object* digests = json_object_new_object();
    auto index = load_artifact_index(root);
    json_object_object_foreach(index.root, aid, info) {
        json_mini::put_string(digests, aid, json_mini::get_string(info, "digest").value_or("unknown"));
    }
    json_mini::put(lock.root, "artifact_digests", digests);
    return lock;
}

std::filesystem::path Lockfile::save(const std::string& project_id, json_object* lock) const {
    json_mini::Doc generated;
    if (!lock) {
        generated = generate(project_id);
        lock = generated.root;
    }
    const auto path = project_root(project_id) / kLockfileName;
    std::string err = write_atomic(path, json_mini::serialize_sorted(lock, 2) + "\n");
    if (!err.empty()) throw std::runtime_error("cannot write lockfile: " + err);
    return path;
}

json_mini::Doc Lockfile::load(const std::string& project_id) const {
    const auto path = project_root(project_id) / kLockfileName;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) throw std::runtime_error("Lockfile not found: " + path.string());
    std::string err;
    auto doc = json_mini::parse_file(path, &err);
    if (!json_mini::is_object(doc.root)) throw std::runtime_error("Lockfile unreadable: " + path.string() + " " + err);
    return doc;
}

LockVerifyResult Lockfile::verify(const std::string& project_id) const {
    LockVerifyResult r;
    json_mini::Doc locked;
    json_mini::Doc current;
    try {
        locked = load(project_id);
        current = generate(project_id);
    } catch (const std::runtime_error& e) {
        r.error = e.what();
        return r;
    }
    r.lockfile_version = json_mini::get_string(locked.root, "lockfile_version").value_or("");
    r.generated_at = json_mini::get_string(locked.root, "generated_at").value_or("");

    for (const char* section : {"policy", "pipeline"}) {
        std::string want = field_or(locked.root, section, "digest");
        std::string have = field_or(current.root, section, "digest");
        if (want != have) r.mismatches.push_back({section, "digest", want, have});
    }

    json_object* cur_links = json_mini::get(current.root, "links");
    json_object* old_links = json_mini::get(locked.root, "links");
    if (!json_mini::is_object(old_links)) old_links = json_mini::get(current.root, "links");
    json_object_object_foreach(old_links, id, info) {
        std::string want = json_mini::get_string(info, "digest").value_or("(missing)");
        std::string have = json_mini::get_string(json_mini::get(cur_links, id), "digest").value_or("(missing)");
        if (want != have) r.mismatches.push_back({std::string("link:") + id, "digest", want, have});
    }

    std::string want = field_or(locked.root, "environment", "compiler");
    std::string have = field_or(current.root, "environment", "compiler");
    if (want != have) r.mismatches.push_back({"environment", "compiler", want, have});

    r.verified = r.mismatches.empty();
    return r;
}

std::vector<std::string> compare_lockfiles(json_object* a, json_object* b) {
    std::set<std::string> keys;
    if (json_mini::is_object(a)) {
        json_object_object_foreach(a, k, v) {
            (void)v;
            keys.insert(k);
        }
    }
    if (json_mini::is_object(b)) {
        json_object_object_foreach(b, k, v) {
            (void)v;
            keys.insert(k);
        }
    }

    std::vector<std::string> out;
    for (const auto& k : keys) {
        if (k == "generated_at") continue;
        json_object* va = json_mini::get(a, k.c_str());
        json_object* vb = json_mini::get(b, k.c_str());
        if (!va || !vb || json_mini::canonical(va) != json_mini::canonical(vb)) out.push_back(k);
    }
    return out;
}

} // namespace dawn
