#include "dawn/link_runner.h"
#include "dawn/config.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dawn {

namespace {

constexpr int kChildResultWriteFailed = 3;

bool write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t off = 0;
    while (off < data.size()) {
        ssize_t w = ::write(fd, p + off, data.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += (size_t)w;
    }
    return true;
}

// Serialized in the child: {status, metrics, errors, published[], exception}
std::string encode_result(const LinkResult& r, const Sandbox& sb, const std::string& exception) {
    auto o = json_mini::new_object();
    json_mini::put_string(o.root, "status", r.status);
    json_mini::put(o.root, "metrics", r.metrics.root ? json_mini::clone(r.metrics.root) : json_object_new_object());
    json_mini::put(o.root, "errors", r.errors.root ? json_mini::clone(r.errors.root) : json_object_new_object());
    json_object* pubs = json_object_new_array();
    for (const auto& p : sb.published()) {
        json_object* e = json_object_new_object();
        json_mini::put_string(e, "artifact_id", p.artifact_id);
        json_mini::put_string(e, "path", p.path.string());
        json_mini::put_string(e, "schema", p.schema);
        json_object_array_add(pubs, e);
    }
    json_mini::put(o.root, "published", pubs);
    if (!exception.empty()) json_mini::put_string(o.root, "exception", exception);
    return json_mini::to_compact(o.root);
}

void decode_result(const std::string& raw, LinkRunOutcome* out) {
    auto doc = json_mini::parse(raw);
    if (!json_mini::is_object(doc.root)) {
        out->crashed = true;
        out->error = "link process returned an unreadable result";
        return;
    }
    out->result.status = json_mini::get_string(doc.root, "status").value_or("SUCCEEDED");
    json_object* m = json_mini::get(doc.root, "metrics");
    json_object* e = json_mini::get(doc.root, "errors");
    if (json_mini::is_object(m)) out->result.metrics = json_mini::Doc(json_mini::clone(m));
    if (json_mini::is_object(e)) out->result.errors = json_mini::Doc(json_mini::clone(e));
    out->exception = json_mini::get_string(doc.root, "exception").value_or("");

    json_object* pubs = json_mini::get(doc.root, "published");
    const size_t n = json_mini::is_array(pubs) ? json_object_array_length(pubs) : 0;
    for (size_t i = 0; i < n; i++) {
        json_object* p = json_object_array_get_idx(pubs, i);
        PublishedArtifact pa;
        pa.artifact_id = json_mini::get_string(p, "artifact_id").value_or("");
        pa.path = json_mini::get_string(p, "path").value_or("");
        pa.schema = json_mini::get_string(p, "schema").value_or("");
        if (!pa.artifact_id.empty() && !pa.path.empty()) out->published.push_back(std::move(pa));
    }
}

[[noreturn]] void child_main(int result_fd, const LinkFn& fn, LinkContext& ctx, Sandbox& sandbox) {
    (void)setpgid(0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::chdir(sandbox.root().c_str()) != 0) {
        std::fprintf(stderr, "[ERROR] link %s: chdir(%s) failed: %s\n",
                     ctx.link_id.c_str(), sandbox.root().c_str(), std::strerror(errno));
    }

    LinkResult result;
    std::string exception;
    try {
        result = fn(ctx);
    } catch (const std::exception& e) {
        exception = e.what();
        if (exception.empty()) exception = "link threw an exception without a message";
    }

    std::string payload = encode_result(result, sandbox, exception);
    bool ok = write_all(result_fd, payload);
    ::close(result_fd);
    std::fflush(stdout);
    std::fflush(stderr);
    _exit(ok ? 0 : kChildResultWriteFailed);
}

} // namespace

LinkRunOutcome run_link_isolated(const LinkFn& fn, LinkContext& ctx, Sandbox& sandbox, int timeout_sec) {
    LinkRunOutcome out;

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        out.error = std::string("pipe failed: ") + std::strerror(errno);
        return out;
    }
    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    // buffered output would otherwise be flushed twice
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        out.error = std::string("fork failed: ") + std::strerror(errno);
        return out;
    }
    if (pid == 0) {
        ::close(pipefd[0]);
        child_main(pipefd[1], fn, ctx, sandbox);
    }

    (void)setpgid(pid, pid);
    ::close(pipefd[1]);

    const int64_t timeout_ms = timeout_sec > 0 ? (int64_t)timeout_sec * 1000 : 0;
    auto start = std::chrono::steady_clock::now();
    std::string raw;
    int status = 0;
    struct rusage ru{};
    bool reaped = false;

    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
            if (n > 0) {
                raw.append(buf, (size_t)n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;   // EAGAIN or EOF
        }
    };

    while (true) {
        drain();

        pid_t w = ::wait4(pid, &status, WNOHANG, &ru);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) {
            out.error = std::string("wait4 failed: ") + std::strerror(errno);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        const int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
        if (timeout_ms > 0 && elapsed_ms > timeout_ms) {
            out.timed_out = true;
            // the whole group first, then the direct pid in case it left the group
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            while (::wait4(pid, &status, 0, &ru) < 0 && errno == EINTR) {}
            reaped = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int64_t slice = 50;
        if (timeout_ms > 0) slice = std::max<int64_t>(1, std::min<int64_t>(slice, timeout_ms - elapsed_ms));
        (void)poll(&pfd, 1, (int)slice);
    }

    drain();
    ::close(pipefd[0]);

    if (reaped) {
        out.cpu_sec = (double)ru.ru_utime.tv_sec + ru.ru_utime.tv_usec / 1e6 +
                      (double)ru.ru_stime.tv_sec + ru.ru_stime.tv_usec / 1e6;
        out.mem_mb_peak = (double)ru.ru_maxrss / 1024.0;   // KiB on Linux
        if (WIFEXITED(status)) out.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) out.exit_code = 128 + WTERMSIG(status);
        else out.exit_code = 128;
    }

    if (out.timed_out || !out.error.empty()) return out;

    if (out.exit_code != 0 || raw.empty()) {
        out.crashed = true;
        out.error = "link process exited with code " + std::to_string(out.exit_code) + " without a result";
        return out;
    }
    decode_result(raw, &out);
    return out;
}

} // namespace dawn
