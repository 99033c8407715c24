#include "dawn/shadow.h"
#include "dawn/coherence.h"
#include "dawn/config.h"
#include "dawn/fs_util.h"

namespace dawn {

ShadowState::ShadowState(const std::filesystem::path& project_root)
    : path_(shadow_root(project_root) / "maturity.json") {}

std::filesystem::path ShadowState::shadow_root(const std::filesystem::path& project_root) {
    return project_root / "shadow";
}

void ShadowState::load() {
    pairs_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return;

    std::string err;
    auto doc = json_mini::parse_file(path_, &err);
    if (!json_mini::is_object(doc.root)) {
        log_line(LogLevel::WARN, "ignoring unreadable " + path_.string() + (err.empty() ? "" : ": " + err));
        return;
    }
    json_object_object_foreach(doc.root, key, val) {
        if (!json_mini::is_object(val)) continue;
        ShadowMaturity m;
        m.stable = key;
        m.shadow = json_mini::get_string(val, "shadow").value_or("");
        m.runs = (int)json_mini::get_int(val, "runs").value_or(0);
        m.consecutive_parity = (int)json_mini::get_int(val, "consecutive_parity").value_or(0);
        m.last_parity = json_mini::get_number(val, "last_parity").value_or(0.0);
        m.ready = json_mini::get_bool(val, "ready").value_or(false);
        m.approved = json_mini::get_bool(val, "approved").value_or(false);
        m.approved_by = json_mini::get_string(val, "approved_by").value_or("");
        m.approved_at = json_mini::get_string(val, "approved_at").value_or("");
        if (!m.shadow.empty()) pairs_[m.stable] = m;
    }
}

std::string ShadowState::save() const {
    auto doc = json_mini::new_object();
    for (const auto& kv : pairs_) {
        const auto& m = kv.second;
        json_object* o = json_object_new_object();
        json_mini::put_string(o, "shadow", m.shadow);
        json_mini::put_int(o, "runs", m.runs);
        json_mini::put_int(o, "consecutive_parity", m.consecutive_parity);
        json_mini::put_double(o, "last_parity", m.last_parity);
        json_mini::put_bool(o, "ready", m.ready);
        json_mini::put_bool(o, "approved", m.approved);
        if (!m.approved_by.empty()) json_mini::put_string(o, "approved_by", m.approved_by);
        if (!m.approved_at.empty()) json_mini::put_string(o, "approved_at", m.approved_at);
        json_mini::put(doc.root, kv.first.c_str(), o);
    }
    return write_atomic(path_, json_mini::serialize_sorted(doc.root, 2) + "\n");
}

ShadowMaturity& ShadowState::entry(const std::string& stable, const std::string& shadow) {
    auto it = pairs_.find(stable);
    if (it == pairs_.end() || it->second.shadow != shadow) {
        ShadowMaturity m;
        m.stable = stable;
        m.shadow = shadow;
        pairs_[stable] = m;
    }
    return pairs_[stable];
}

const ShadowMaturity* ShadowState::find(const std::string& stable) const {
    auto it = pairs_.find(stable);
    return it == pairs_.end() ? nullptr : &it->second;
}

std::vector<ShadowMaturity> ShadowState::entries() const {
    std::vector<ShadowMaturity> out;
    for (const auto& kv : pairs_) out.push_back(kv.second);
    return out;
}

bool ShadowState::record_parity(ShadowMaturity& m, double parity, double threshold, int window) {
    m.runs++;
    m.last_parity = parity;
    if (parity >= threshold) m.consecutive_parity++;
    else m.consecutive_parity = 0;

    if (!m.ready && m.consecutive_parity >= window) {
        m.ready = true;
        return true;
    }
    return false;
}

double artifact_parity(const std::vector<ArtifactRecord>& stable, const ArtifactStore& shadow_store) {
    if (stable.empty()) return 1.0;

    double sum = 0.0;
    for (const auto& rec : stable) {
        const ArtifactRecord* other = shadow_store.get(rec.artifact_id);
        if (!other) continue;

        double p = -1.0;
        auto a = json_mini::parse_file(rec.path);
        auto b = json_mini::parse_file(other->path);
        if (a && b) p = node_set_overlap(a.root, b.root);
        if (p < 0.0) p = rec.digest == other->digest ? 1.0 : 0.0;
        sum += p;
    }
    return sum / (double)stable.size();
}

} // namespace dawn
