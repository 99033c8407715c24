#pragma once

#include <filesystem>
#include <string>

namespace dawn {

// Exclusive, non-blocking flock on <project>/.lock held for the object's
// lifetime. Contention throws ProjectBusyError immediately.
class ProjectLock {
public:
    explicit ProjectLock(const std::filesystem::path& project_root);
    ~ProjectLock();

    ProjectLock(const ProjectLock&) = delete;
    ProjectLock& operator=(const ProjectLock&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_{-1};
};

} // namespace dawn
