#include "test_common.h"

#include "dawn/artifact_store.h"
#include "dawn/link_runner.h"

#include <chrono>
#include <thread>

#include <unistd.h>

using namespace dawn;

namespace {

LinkContext make_ctx(const std::filesystem::path& root, const std::string& link_id) {
    LinkContext ctx;
    ctx.project_id = "p";
    ctx.link_id = link_id;
    ctx.project_root = root;
    return ctx;
}

} // namespace

int main() {
    auto root = fresh_dir("dawn_test_link_runner");
    ArtifactStore store(root);

    // Test 1: result, metrics and published records come back from the child.
    {
        Sandbox sb(store.artifacts_dir(), "ok.link", nullptr);
        auto ctx = make_ctx(root, "ok.link");
        ctx.sandbox = &sb;
        LinkFn fn = [](LinkContext& c) {
            auto d = json_mini::new_object();
            json_mini::put_string(d.root, "hello", c.project_id);
            c.sandbox->publish("ok.out", "out.json", d.root);
            // cwd is the sandbox root
            write_text("cwd.txt", "here");
            LinkResult r;
            r.metrics = json_mini::new_object();
            json_mini::put_int(r.metrics.root, "items", 4);
            return r;
        };
        auto out = run_link_isolated(fn, ctx, sb, 10);
        expect_true(!out.timed_out && !out.crashed, "clean run");
        expect_true(out.error.empty() && out.exception.empty(), "no error: " + out.error + out.exception);
        expect_eq_str(out.result.status, "SUCCEEDED", "status");
        expect_eq_ll(json_mini::get_int(out.result.metrics.root, "items").value_or(0), 4, "metrics");
        expect_eq_ll((long long)out.published.size(), 1, "published record");
        expect_eq_str(out.published[0].artifact_id, "ok.out", "published id");
        expect_true(std::filesystem::exists(out.published[0].path), "published file on disk");
        expect_true(std::filesystem::exists(sb.root() / "cwd.txt"), "child ran inside the sandbox root");
        expect_true(sb.published().empty(), "parent sandbox untouched by child publishes");
    }

    // Test 2: reported failure.
    {
        Sandbox sb(store.artifacts_dir(), "fail.link", nullptr);
        auto ctx = make_ctx(root, "fail.link");
        ctx.sandbox = &sb;
        auto out = run_link_isolated([](LinkContext&) { return LinkResult::failed("SCHEMA_INVALID", "bad"); },
                                     ctx, sb, 10);
        expect_eq_str(out.result.status, "FAILED", "failed status");
        expect_eq_str(json_mini::get_string(out.result.errors.root, "type").value_or(""), "SCHEMA_INVALID",
                      "failure type");
    }

    // Test 3: exceptions are captured.
    {
        Sandbox sb(store.artifacts_dir(), "throw.link", nullptr);
        auto ctx = make_ctx(root, "throw.link");
        ctx.sandbox = &sb;
        auto out = run_link_isolated([](LinkContext&) -> LinkResult { throw std::runtime_error("boom"); },
                                     ctx, sb, 10);
        expect_eq_str(out.exception, "boom", "exception message");
        expect_true(!out.crashed, "exception is not a crash");
    }

    // Test 4: a child that dies without a result.
    {
        Sandbox sb(store.artifacts_dir(), "crash.link", nullptr);
        auto ctx = make_ctx(root, "crash.link");
        ctx.sandbox = &sb;
        auto out = run_link_isolated([](LinkContext&) -> LinkResult { _exit(7); }, ctx, sb, 10);
        expect_true(out.crashed, "crash detected");
        expect_eq_ll(out.exit_code, 7, "exit code");
    }

    // Test 5: deadline kills the whole process group.
    {
        Sandbox sb(store.artifacts_dir(), "slow.link", nullptr);
        auto ctx = make_ctx(root, "slow.link");
        ctx.sandbox = &sb;
        const auto marker = sb.root() / "grandchild_done";
        LinkFn fn = [marker](LinkContext&) -> LinkResult {
            if (fork() == 0) {
                std::this_thread::sleep_for(std::chrono::seconds(3));
                write_text(marker, "survived");
                _exit(0);
            }
            std::this_thread::sleep_for(std::chrono::seconds(10));
            return LinkResult::ok();
        };
        auto t0 = std::chrono::steady_clock::now();
        auto out = run_link_isolated(fn, ctx, sb, 1);
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(out.timed_out, "timed out");
        expect_true(secs < 5, "returned promptly after the deadline");

        std::this_thread::sleep_for(std::chrono::seconds(4));
        expect_true(!std::filesystem::exists(marker), "grandchild was killed with the group");
    }

    // Test 6: a limit whose millisecond value exceeds 32 bits is not cut short.
    {
        Sandbox sb(store.artifacts_dir(), "patient.link", nullptr);
        auto ctx = make_ctx(root, "patient.link");
        ctx.sandbox = &sb;
        LinkFn fn = [](LinkContext&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            return LinkResult::ok();
        };
        // 4294968 s is 4294968000 ms, which wraps to 704 ms in 32-bit arithmetic
        auto out = run_link_isolated(fn, ctx, sb, 4294968);
        expect_true(!out.timed_out, "large limit does not expire early");
        expect_eq_str(out.result.status, "SUCCEEDED", "patient link finished");
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::cerr << "test_link_runner: ALL PASSED" << std::endl;
    return 0;
}
