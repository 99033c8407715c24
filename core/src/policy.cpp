#include "dawn/policy.h"
#include "dawn/crypto.h"
#include "dawn/yaml_json.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dawn {

namespace {

const char* kRequiredKeys[] = {"version", "budgets", "security", "profiles", "default_profile"};
const char* kRequiredBudgetSections[] = {"per_link", "per_project"};
const char* kRequiredPerLinkKeys[] = {"max_wall_time_sec", "max_output_bytes"};
const char* kRequiredPerProjectKeys[] = {"max_project_bytes"};
const char* kRequiredProfileKeys[] = {"allow_src_writes", "artifact_only_outputs"};

bool has_key(json_object* o, const char* key) {
    if (!json_mini::is_object(o)) return false;
    json_object* v = nullptr;
    // present-but-null still counts as present
    return json_object_object_get_ex(o, key, &v);
}

// "2.0.0" -> 2. Unquoted YAML like `version: 2.1` arrives as a double.
std::string scalar_text(json_object* v) {
    if (!v) return "";
    if (json_object_is_type(v, json_type_string)) return json_object_get_string(v);
    return json_object_to_json_string_ext(v, json_mini::kPlainFlags);
}

bool version_major(const std::string& v, long* major) {
    if (v.empty() || !(v[0] >= '0' && v[0] <= '9')) return false;
    char* end = nullptr;
    *major = std::strtol(v.c_str(), &end, 10);
    return end && (*end == '\0' || *end == '.');
}

} // namespace

PolicyLoader::PolicyLoader(std::filesystem::path path) : path_(std::move(path)) {}

void PolicyLoader::load() {
    // reset first so a failed reload never leaves a stale policy behind
    loaded_ = false;
    doc_ = json_mini::Doc{};
    version_.clear();
    digest_.clear();
    default_profile_.clear();
    profiles_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        throw PolicyValidationError("Policy file not found: " + path_.string());
    }

    json_mini::Doc doc;
    try {
        doc = load_yaml_file(path_);
    } catch (const std::runtime_error& e) {
        throw PolicyValidationError(std::string("Invalid YAML in policy file: ") + e.what());
    }
    if (!doc) throw PolicyValidationError("Policy file is empty: " + path_.string());
    if (!json_mini::is_object(doc.root)) {
        throw PolicyValidationError("Policy document must be a mapping: " + path_.string());
    }

    json_object* root = doc.root;
    for (const char* key : kRequiredKeys) {
        if (!has_key(root, key)) throw PolicyValidationError(std::string("Missing required key: ") + key);
    }

    json_object* budgets = json_mini::get(root, "budgets");
    for (const char* s : kRequiredBudgetSections) {
        if (!has_key(budgets, s)) {
            throw PolicyValidationError(std::string("Missing required budget section: budgets.") + s);
        }
    }
    json_object* per_link = json_mini::get(budgets, "per_link");
    for (const char* k : kRequiredPerLinkKeys) {
        if (!has_key(per_link, k)) {
            throw PolicyValidationError(std::string("Missing required budget key: budgets.per_link.") + k);
        }
    }
    json_object* per_project = json_mini::get(budgets, "per_project");
    for (const char* k : kRequiredPerProjectKeys) {
        if (!has_key(per_project, k)) {
            throw PolicyValidationError(std::string("Missing required budget key: budgets.per_project.") + k);
        }
    }

    json_object* profiles = json_mini::get(root, "profiles");
    std::string default_profile = scalar_text(json_mini::get(root, "default_profile"));
    if (!has_key(profiles, default_profile.c_str())) {
        throw PolicyValidationError("default_profile '" + default_profile + "' not found in profiles");
    }

    std::map<std::string, ProfileConfig> parsed;
    json_object_object_foreach(profiles, pname, pcfg) {
        for (const char* k : kRequiredProfileKeys) {
            if (!has_key(pcfg, k)) {
                throw PolicyValidationError(std::string("Missing required key in profile '") + pname + "': " + k);
            }
        }
        ProfileConfig pc;
        pc.name = pname;
        pc.allow_src_writes = json_mini::get_bool(pcfg, "allow_src_writes").value_or(false);
        pc.artifact_only_outputs = json_mini::get_bool(pcfg, "artifact_only_outputs").value_or(false);
        pc.timeout_multiplier = json_mini::get_number(pcfg, "timeout_multiplier").value_or(1.0);
        if (json_mini::is_array(json_mini::get(pcfg, "allowed_subprocess_commands"))) {
            pc.allowed_subprocess_commands = json_mini::get_array_strings(pcfg, "allowed_subprocess_commands");
        }
        parsed[pc.name] = std::move(pc);
    }

    std::string version = scalar_text(json_mini::get(root, "version"));
    long major = 0;
    if (!version_major(version, &major)) {
        throw PolicyValidationError("Policy version '" + version + "' is not a semantic version");
    }
    if (major < 2) {
        throw PolicyValidationError("Policy version " + version +
                                    " uses deprecated schema. Migrate to version 2.0.0 "
                                    "(remove 'limits' block, use 'budgets' instead).");
    }

    if (has_key(root, "limits")) {
        throw PolicyValidationError("Deprecated 'limits' block found. "
                                    "Remove it and use 'budgets' block instead (v2.0.0 schema).");
    }

    digest_ = sha256_hex(json_mini::canonical(root));
    version_ = version;
    default_profile_ = default_profile;
    profiles_ = std::move(parsed);
    doc_ = std::move(doc);
    loaded_ = true;
}

void PolicyLoader::require_loaded() const {
    if (!loaded_) throw std::runtime_error("Policy not loaded. Call load() first.");
}

json_object* PolicyLoader::section(const char* key) const {
    require_loaded();
    return json_mini::get(doc_.root, key);
}

const std::string& PolicyLoader::version() const {
    require_loaded();
    return version_;
}

const std::string& PolicyLoader::digest() const {
    require_loaded();
    return digest_;
}

const std::string& PolicyLoader::default_profile() const {
    require_loaded();
    return default_profile_;
}

json_object* PolicyLoader::document() const {
    require_loaded();
    return doc_.root;
}

const ProfileConfig& PolicyLoader::get_profile(const std::string& name) const {
    require_loaded();
    const std::string& key = name.empty() ? default_profile_ : name;
    auto it = profiles_.find(key);
    if (it == profiles_.end()) throw PolicyValidationError("Profile '" + key + "' not found");
    return it->second;
}

std::vector<std::string> PolicyLoader::profile_names() const {
    require_loaded();
    std::vector<std::string> out;
    for (const auto& kv : profiles_) out.push_back(kv.first);
    return out;
}

std::optional<int64_t> PolicyLoader::get_budget(const std::string& sect, const std::string& key) const {
    json_object* s = json_mini::get(section("budgets"), sect.c_str());
    auto v = json_mini::get_number(s, key.c_str());
    if (!v) return std::nullopt;
    return (int64_t)*v;
}

int PolicyLoader::effective_timeout(const std::string& profile) const {
    const ProfileConfig& p = get_profile(profile);
    auto base = get_budget("per_link", "max_wall_time_sec");
    int64_t base_sec = (base && *base > 0) ? *base : 60;
    const double scaled = std::floor((double)base_sec * p.timeout_multiplier);
    if (!(scaled >= 1.0)) return 1;
    if (scaled >= (double)kMaxLinkTimeoutSec) return kMaxLinkTimeoutSec;
    return (int)scaled;
}

bool PolicyLoader::is_src_write_allowed(const std::string& link_id, const std::string& profile) const {
    const ProfileConfig& p = get_profile(profile);
    if (!p.allow_src_writes) return false;
    auto allowed = json_mini::get_array_strings(section("security"), "allow_src_writes");
    return std::find(allowed.begin(), allowed.end(), link_id) != allowed.end();
}

std::vector<std::string> PolicyLoader::allowed_subprocess_commands(const std::string& profile) const {
    const ProfileConfig& p = get_profile(profile);
    if (p.allowed_subprocess_commands) return *p.allowed_subprocess_commands;
    return json_mini::get_array_strings(section("security"), "allowed_subprocess_commands");
}

// ---------- retry ----------

int PolicyLoader::max_retries_per_link() const {
    return (int)json_mini::get_int(section("retry"), "max_retries_per_link").value_or(3);
}

int PolicyLoader::max_retries_per_project() const {
    return (int)json_mini::get_int(section("retry"), "max_retries_per_project").value_or(10);
}

int PolicyLoader::backoff_seconds(int attempt) const {
    std::vector<int> schedule = {1, 5, 30};
    json_object* arr = json_mini::get(section("retry"), "backoff_schedule");
    if (json_mini::is_array(arr)) {
        schedule.clear();
        const size_t n = json_object_array_length(arr);
        for (size_t i = 0; i < n; i++) {
            json_object* el = json_object_array_get_idx(arr, i);
            if (el && (json_object_is_type(el, json_type_int) || json_object_is_type(el, json_type_double))) {
                schedule.push_back((int)json_object_get_int64(el));
            }
        }
    }
    if (schedule.empty()) return 30;
    if (attempt < 0) attempt = 0;
    if ((size_t)attempt < schedule.size()) return schedule[(size_t)attempt];
    return schedule.back();
}

std::vector<std::string> PolicyLoader::retryable_errors() const {
    return json_mini::get_array_strings(section("retry"), "retryable_errors");
}

std::vector<std::string> PolicyLoader::non_retryable_errors() const {
    return json_mini::get_array_strings(section("retry"), "non_retryable_errors");
}

bool PolicyLoader::is_error_retryable(const std::string& kind) const {
    auto non = non_retryable_errors();
    if (std::find(non.begin(), non.end(), kind) != non.end()) return false;
    auto yes = retryable_errors();
    return std::find(yes.begin(), yes.end(), kind) != yes.end();
}

// ---------- retention ----------

int PolicyLoader::keep_last_n_runs() const {
    return (int)json_mini::get_int(section("retention"), "keep_last_n_runs").value_or(3);
}

int PolicyLoader::keep_failed_runs_days() const {
    return (int)json_mini::get_int(section("retention"), "keep_failed_runs_days").value_or(7);
}

std::vector<std::string> PolicyLoader::protected_artifacts() const {
    json_object* r = section("retention");
    if (json_mini::is_array(json_mini::get(r, "protected_artifacts"))) {
        return json_mini::get_array_strings(r, "protected_artifacts");
    }
    return {"dawn.evidence.pack", "dawn.release.bundle", "dawn.metrics.run_summary"};
}

bool PolicyLoader::preserve_ledger() const {
    return json_mini::get_bool(section("retention"), "preserve_ledger").value_or(true);
}

json_mini::Doc PolicyLoader::to_json() const {
    require_loaded();
    auto out = json_mini::new_object();
    json_mini::put_string(out.root, "version", version_);
    json_mini::put_string(out.root, "digest", digest_);
    json_mini::put_string(out.root, "default_profile", default_profile_);
    json_object* b = section("budgets");
    json_object* r = section("retry");
    json_object* t = section("retention");
    json_mini::put(out.root, "budgets", b ? json_mini::clone(b) : json_object_new_object());
    json_mini::put(out.root, "retry", r ? json_mini::clone(r) : json_object_new_object());
    json_mini::put(out.root, "retention", t ? json_mini::clone(t) : json_object_new_object());
    return out;
}

} // namespace dawn
