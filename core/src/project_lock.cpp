#include "dawn/project_lock.h"
#include "dawn/config.h"
#include "dawn/errors.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace dawn {

ProjectLock::ProjectLock(const std::filesystem::path& project_root) : path_(project_root / ".lock") {
    std::error_code ec;
    std::filesystem::create_directories(project_root, ec);
    if (ec) throw std::runtime_error("cannot create project dir " + project_root.string() + ": " + ec.message());

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) throw std::runtime_error("lock open failed: " + path_.string() + ": " + std::strerror(errno));

    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int e = errno;
        ::close(fd_);
        fd_ = -1;
        if (e == EWOULDBLOCK) {
            throw ProjectBusyError("Project " + project_root.filename().string() +
                                   " is currently locked by another process (BUSY)");
        }
        throw std::runtime_error("flock failed on " + path_.string() + ": " + std::strerror(e));
    }

    // holder pid, informational only
    if (::ftruncate(fd_, 0) == 0) {
        char buf[32];
        int n = std::snprintf(buf, sizeof(buf), "%d\n", (int)getpid());
        if (n > 0 && ::pwrite(fd_, buf, (size_t)n, 0) < 0) {
            log_line(LogLevel::WARN, "cannot record pid in " + path_.string());
        }
    }
}

ProjectLock::~ProjectLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace dawn
