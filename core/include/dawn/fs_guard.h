#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dawn {

struct FileStamp {
    int64_t mtime_ns{0};
    uint64_t size{0};
};

// Relative path ("artifacts/x/out.json") -> stamp, regular files only.
using FsSnapshot = std::unordered_map<std::string, FileStamp>;

FsSnapshot snapshot_tree(const std::filesystem::path& root);

// Sum of regular file sizes under root (0 when root does not exist).
uint64_t dir_size_bytes(const std::filesystem::path& root);

// Set of allowed relative path prefixes, matched component-wise:
// "src" covers "src/a.c" but not "src2/a.c".
class PathPrefixSet {
public:
    PathPrefixSet();
    ~PathPrefixSet();
    PathPrefixSet(PathPrefixSet&&) noexcept;
    PathPrefixSet& operator=(PathPrefixSet&&) noexcept;

    void add(const std::string& rel_prefix);
    bool covers(const std::string& rel_path) const;

private:
    struct Node;
    std::unique_ptr<Node> root_;
};

// Files maintained by the orchestrator itself while a link runs.
bool is_orchestrator_file(const std::string& rel_path);

// Paths created or modified between pre and post that fall outside allowed
// and are not orchestrator bookkeeping. Sorted.
std::vector<std::string> find_leaks(const FsSnapshot& pre, const FsSnapshot& post,
                                    const PathPrefixSet& allowed);

} // namespace dawn
