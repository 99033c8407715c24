#include "dawn/fs_guard.h"

#include <algorithm>

#include <sys/stat.h>

namespace dawn {

namespace {

std::vector<std::string> split_components(const std::string& rel) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : rel) {
        if (c == '/') {
            if (!cur.empty() && cur != ".") parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur != ".") parts.push_back(cur);
    return parts;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

FsSnapshot snapshot_tree(const std::filesystem::path& root) {
    FsSnapshot snap;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) return snap;

    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        struct stat st{};
        if (::stat(it->path().c_str(), &st) != 0) continue;   // vanished mid-scan
        FileStamp fs;
        fs.mtime_ns = (int64_t)st.st_mtim.tv_sec * 1000000000LL + st.st_mtim.tv_nsec;
        fs.size = (uint64_t)st.st_size;
        snap[it->path().lexically_relative(root).generic_string()] = fs;
    }
    return snap;
}

uint64_t dir_size_bytes(const std::filesystem::path& root) {
    uint64_t total = 0;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) return 0;
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        auto sz = it->file_size(fec);
        if (!fec) total += sz;
    }
    return total;
}

struct PathPrefixSet::Node {
    std::map<std::string, std::unique_ptr<Node>> children;
    bool terminal{false};
};

PathPrefixSet::PathPrefixSet() : root_(std::make_unique<Node>()) {}
PathPrefixSet::~PathPrefixSet() = default;
PathPrefixSet::PathPrefixSet(PathPrefixSet&&) noexcept = default;
PathPrefixSet& PathPrefixSet::operator=(PathPrefixSet&&) noexcept = default;

void PathPrefixSet::add(const std::string& rel_prefix) {
    Node* n = root_.get();
    for (const auto& part : split_components(rel_prefix)) {
        auto& child = n->children[part];
        if (!child) child = std::make_unique<Node>();
        n = child.get();
    }
    n->terminal = true;
}

bool PathPrefixSet::covers(const std::string& rel_path) const {
    const Node* n = root_.get();
    if (n->terminal) return true;
    for (const auto& part : split_components(rel_path)) {
        auto it = n->children.find(part);
        if (it == n->children.end()) return false;
        n = it->second.get();
        if (n->terminal) return true;
    }
    return false;
}

bool is_orchestrator_file(const std::string& p) {
    if (p == "artifact_index.json" || p == "project_index.json" || p == "pipeline.yaml" || p == ".lock") {
        return true;
    }
    if (starts_with(p, "runs/") || starts_with(p, "ledger/")) return true;
    if (ends_with(p, ".dawn_artifacts.json")) return true;
    if (p.find("package.metrics") != std::string::npos) return true;
    return false;
}

std::vector<std::string> find_leaks(const FsSnapshot& pre, const FsSnapshot& post,
                                    const PathPrefixSet& allowed) {
    std::vector<std::string> leaks;
    for (const auto& kv : post) {
        const std::string& path = kv.first;
        if (is_orchestrator_file(path)) continue;
        if (allowed.covers(path)) continue;
        auto it = pre.find(path);
        if (it == pre.end() || it->second.mtime_ns != kv.second.mtime_ns || it->second.size != kv.second.size) {
            leaks.push_back(path);
        }
    }
    std::sort(leaks.begin(), leaks.end());
    return leaks;
}

} // namespace dawn
