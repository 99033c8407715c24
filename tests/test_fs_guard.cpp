#include "test_common.h"

#include "dawn/fs_guard.h"

#include <chrono>
#include <thread>

using namespace dawn;

int main() {
    // Component-wise prefix matching.
    {
        PathPrefixSet s;
        s.add("src");
        s.add("artifacts/gen.link");
        expect_true(s.covers("src/a.c"), "src/a.c covered");
        expect_true(s.covers("src"), "prefix itself covered");
        expect_true(!s.covers("src2/a.c"), "sibling name not covered");
        expect_true(s.covers("artifacts/gen.link/out.json"), "nested prefix");
        expect_true(!s.covers("artifacts/gen.link2/out.json"), "nested sibling not covered");
        expect_true(!s.covers("artifacts/other/out.json"), "other link dir not covered");
        expect_true(!s.covers("artifacts"), "parent of prefix not covered");

        PathPrefixSet all;
        all.add("");
        expect_true(all.covers("anything/at/all"), "empty prefix covers everything");
    }

    expect_true(is_orchestrator_file("artifact_index.json"), "index is bookkeeping");
    expect_true(is_orchestrator_file("ledger/events.jsonl"), "ledger is bookkeeping");
    expect_true(is_orchestrator_file("artifacts/x/.dawn_artifacts.json"), "manifest is bookkeeping");
    expect_true(!is_orchestrator_file("src/main.c"), "sources are not");

    auto root = fresh_dir("dawn_test_fs_guard");
    write_text(root / "src" / "main.c", "int main(){}");
    write_text(root / "inputs" / "a.txt", "a");
    write_text(root / "artifacts" / "gen" / "old.json", "{}");

    const FsSnapshot pre = snapshot_tree(root);
    expect_eq_ll((long long)pre.size(), 3, "three files snapshotted");
    expect_eq_ll((long long)dir_size_bytes(root), 12 + 1 + 2, "size sum");
    expect_eq_ll((long long)dir_size_bytes(root / "nope"), 0, "missing dir size 0");

    // mtime resolution on some filesystems is coarse
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    write_text(root / "artifacts" / "gen" / "new.json", "{\"x\":1}");
    write_text(root / "src" / "main.c", "int main(){return 1;}");
    write_text(root / "notes.md", "leak");
    write_text(root / "artifact_index.json", "{}");

    const FsSnapshot post = snapshot_tree(root);

    PathPrefixSet allowed;
    allowed.add("artifacts/gen");
    allowed.add("inputs");
    auto leaks = find_leaks(pre, post, allowed);
    expect_eq_ll((long long)leaks.size(), 2, "two leaks");
    expect_eq_str(leaks[0], "notes.md", "new file outside roots");
    expect_eq_str(leaks[1], "src/main.c", "modified source");

    allowed.add("src");
    allowed.add("notes.md");
    expect_true(find_leaks(pre, post, allowed).empty(), "granted paths are not leaks");

    // An untouched file outside the roots is not a leak.
    PathPrefixSet none;
    expect_true(find_leaks(post, post, none).empty(), "no change, no leak");

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::cerr << "test_fs_guard: ALL PASSED" << std::endl;
    return 0;
}
