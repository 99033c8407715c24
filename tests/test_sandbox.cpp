#include "test_common.h"

#include "dawn/artifact_store.h"
#include "dawn/errors.h"
#include "dawn/project_lock.h"
#include "dawn/sandbox.h"

#include <sys/wait.h>
#include <unistd.h>

using namespace dawn;

int main() {
    auto root = fresh_dir("dawn_test_sandbox");
    ArtifactStore store(root);

    // Test 1: writes land under artifacts/<link>/ and publish registers.
    {
        Sandbox sb(store.artifacts_dir(), "demo.link", &store);
        expect_true(sb.root() == root / "artifacts" / "demo.link", "sandbox root");

        auto doc = json_mini::new_object();
        json_mini::put_int(doc.root, "n", 3);
        auto p = sb.publish("demo.out", "nested/out.json", doc.root);
        expect_true(std::filesystem::exists(p), "published file exists");
        expect_true(store.get("demo.out") != nullptr, "publish registers with the store");
        expect_eq_str(store.get("demo.out")->producer_link_id, "demo.link", "producer recorded");

        sb.publish_text("demo.txt", "a.txt", "hi");
        expect_eq_ll((long long)sb.published().size(), 2, "published list");
        expect_eq_str(read_text(sb.root() / "a.txt"), "hi", "text written");

        write_text(root / "src.bin", "bytes");
        auto c = sb.copy_in(root / "src.bin", "copy/src.bin");
        expect_eq_str(read_text(c), "bytes", "copy_in");
    }

    // Test 2: escapes are rejected.
    {
        Sandbox sb(store.artifacts_dir(), "demo.link", nullptr);
        for (const char* bad : {"../escape.txt", "a/../../escape.txt", "/etc/passwd", ""}) {
            try {
                sb.write_text(bad, "x");
                die(std::string("escape should throw: ") + bad);
            } catch (const std::runtime_error&) {
            }
        }
        expect_true(!std::filesystem::exists(root / "artifacts" / "escape.txt"), "nothing escaped");
        sb.write_text("a/./b/../c.txt", "ok");
        expect_true(std::filesystem::exists(sb.root() / "a" / "c.txt"), "normalized inner path allowed");
        expect_true(sb.published().empty(), "plain writes are not published");
    }

    // Test 3: the project lock is exclusive, also across processes.
    {
        auto proj = fresh_dir("dawn_test_sandbox_lock");
        {
            ProjectLock lock(proj);
            try {
                ProjectLock second(proj);
                die("second lock in the same process should be busy");
            } catch (const ProjectBusyError&) {
            }

            pid_t pid = fork();
            if (pid == 0) {
                try {
                    ProjectLock child(proj);
                    _exit(1);
                } catch (const ProjectBusyError&) {
                    _exit(0);
                }
            }
            int status = 0;
            waitpid(pid, &status, 0);
            expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0, "child sees the project busy");
        }
        ProjectLock after(proj);
        expect_true(std::filesystem::exists(after.path()), "lock file present");
        std::error_code ec;
        std::filesystem::remove_all(proj, ec);
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
