#pragma once

#include "dawn/json_mini.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dawn {

// One lifecycle event. Null documents are written as {}.
struct LedgerEvent {
    std::string project_id;
    std::string pipeline_id;
    std::string link_id;
    std::string run_id;
    std::string step_id;
    std::string status;   // STARTED | SUCCEEDED | FAILED | SKIPPED | DRIFT_DETECTED
    json_mini::Doc inputs;
    json_mini::Doc outputs;
    json_mini::Doc metrics;
    json_mini::Doc errors;
    json_mini::Doc policy_versions;
    std::optional<double> drift_score;
    json_mini::Doc drift_metadata;
};

struct ChainReport {
    bool ok{true};
    size_t lines{0};
    size_t first_bad_line{0};   // 1-based, 0 when ok
    std::string error;
};

// Ledger: append-only JSONL audit log at <project>/ledger/events.jsonl.
//
// Every line is canonical (sorted-key) JSON carrying
//   chain_prev  hash of the previous line (64 zeros for the first)
//   chain_hash  SHA256(chain_prev || record), record = line without chain fields
// The chain resumes from the last line when an existing ledger is opened.
//
// Thread-safe, with optional fsync per append.
class Ledger {
public:
    explicit Ledger(const std::filesystem::path& project_root);
    ~Ledger();

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    void set_fsync(bool enable);

    // Appends one event. Throws std::runtime_error when the line cannot be written.
    void log_event(const LedgerEvent& ev);

    // Low-level append of an already-built record. Returns empty string on success.
    std::string append_record(json_object* record);

    // Replays the whole file, optionally filtered by link id.
    std::vector<json_mini::Doc> get_events(const std::string& link_id = "") const;

    // Most recent step_id == link_complete event for link_id, or an empty Doc.
    json_mini::Doc last_link_complete(const std::string& link_id) const;

    // artifact id -> entry, folded from link_complete SUCCEEDED outputs in order.
    json_mini::Doc reconstruct_artifact_index() const;

    ChainReport verify_chain() const;

    const std::filesystem::path& path() const { return path_; }

    static const std::string& genesis_hash();

private:
    std::string open_locked();
    std::vector<std::string> read_lines() const;

    std::filesystem::path path_;
    mutable std::mutex mu_;
    int fd_{-1};
    bool fsync_{false};
    std::string chain_prev_;
};

} // namespace dawn
