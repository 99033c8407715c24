#include "dawn/ledger.h"
#include "dawn/config.h"
#include "dawn/crypto.h"
#include "dawn/fs_util.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dawn {

namespace {

// Canonical lines start with the two chain fields: both sort before every
// event key, so the hashed record is the remainder of the line.
constexpr const char* kHashKey = "{\"chain_hash\":\"";
constexpr const char* kPrevKey = "\",\"chain_prev\":\"";
constexpr size_t kHexLen = 64;

json_object* doc_or_empty(const json_mini::Doc& d) {
    if (d.root) return json_mini::clone(d.root);
    return json_object_new_object();
}

struct SplitLine {
    std::string hash;
    std::string prev;
    std::string record;
};

bool split_chained_line(const std::string& line, SplitLine* out) {
    const size_t hk = std::strlen(kHashKey);
    const size_t pk = std::strlen(kPrevKey);
    const size_t head = hk + kHexLen + pk + kHexLen;
    if (line.size() < head + 2) return false;
    if (line.compare(0, hk, kHashKey) != 0) return false;
    if (line.compare(hk + kHexLen, pk, kPrevKey) != 0) return false;
    if (line[head] != '"') return false;

    out->hash = line.substr(hk, kHexLen);
    out->prev = line.substr(hk + kHexLen + pk, kHexLen);
    // `",` after chain_prev, or `"}` when the record is empty
    if (line[head + 1] == ',') out->record = "{" + line.substr(head + 2);
    else if (line[head + 1] == '}') out->record = "{}";
    else return false;
    return true;
}

} // namespace

const std::string& Ledger::genesis_hash() {
    static const std::string g(kHexLen, '0');
    return g;
}

Ledger::Ledger(const std::filesystem::path& project_root)
    : path_(project_root / "ledger" / "events.jsonl"), chain_prev_(genesis_hash()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) throw std::runtime_error("ledger: create_directories: " + ec.message());

    // resume the hash chain from the last line on disk
    auto lines = read_lines();
    if (!lines.empty()) {
        SplitLine s;
        if (split_chained_line(lines.back(), &s)) {
            chain_prev_ = s.hash;
        } else {
            log_line(LogLevel::WARN, "ledger: last line of " + path_.string() +
                                         " has no chain fields; new events chain from it");
            chain_prev_ = sha256_hex(lines.back());
        }
    }
}

Ledger::~Ledger() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Ledger::set_fsync(bool enable) {
    std::lock_guard<std::mutex> lk(mu_);
    fsync_ = enable;
}

std::string Ledger::open_locked() {
    if (fd_ >= 0) return "";
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);
    return "";
}

std::string Ledger::append_record(json_object* record) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    std::string canonical = json_mini::canonical(record);
    std::string chain_hash = sha256_hex(chain_prev_ + canonical);

    json_object* line_obj = json_mini::clone(record);
    json_mini::put_string(line_obj, "chain_hash", chain_hash);
    json_mini::put_string(line_obj, "chain_prev", chain_prev_);
    std::string line = json_mini::canonical(line_obj);
    json_object_put(line_obj);
    line.push_back('\n');

    const char* p = line.data();
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, p + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += (size_t)w;
    }

    if (fsync_ && ::fsync(fd_) != 0) {
        return std::string("fsync: ") + std::strerror(errno);
    }

    chain_prev_ = chain_hash;
    return "";
}

void Ledger::log_event(const LedgerEvent& ev) {
    json_mini::Doc rec = json_mini::new_object();
    json_mini::put_double(rec.root, "timestamp", epoch_now());
    json_mini::put_string(rec.root, "project_id", ev.project_id);
    json_mini::put_string(rec.root, "pipeline_id", ev.pipeline_id);
    json_mini::put_string(rec.root, "link_id", ev.link_id);
    json_mini::put_string(rec.root, "run_id", ev.run_id);
    json_mini::put_string(rec.root, "step_id", ev.step_id);
    json_mini::put_string(rec.root, "status", ev.status);
    json_mini::put(rec.root, "inputs", doc_or_empty(ev.inputs));
    json_mini::put(rec.root, "outputs", doc_or_empty(ev.outputs));
    json_mini::put(rec.root, "metrics", doc_or_empty(ev.metrics));
    json_mini::put(rec.root, "errors", doc_or_empty(ev.errors));
    json_mini::put(rec.root, "policy_versions", doc_or_empty(ev.policy_versions));
    if (ev.drift_score) json_mini::put_double(rec.root, "drift_score", *ev.drift_score);
    else json_mini::put(rec.root, "drift_score", nullptr);
    json_mini::put(rec.root, "drift_metadata", doc_or_empty(ev.drift_metadata));

    std::string err = append_record(rec.root);
    if (!err.empty()) {
        throw std::runtime_error("ledger append failed (" + path_.string() + "): " + err);
    }
}

std::vector<std::string> Ledger::read_lines() const {
    std::vector<std::string> out;
    std::ifstream f(path_);
    if (!f) return out;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty()) out.push_back(std::move(line));
    }
    return out;
}

std::vector<json_mini::Doc> Ledger::get_events(const std::string& link_id) const {
    std::vector<json_mini::Doc> out;
    size_t lineno = 0;
    for (const auto& line : read_lines()) {
        lineno++;
        auto d = json_mini::parse(line);
        if (!json_mini::is_object(d.root)) {
            log_line(LogLevel::WARN, "ledger: unparseable line " + std::to_string(lineno) + " in " + path_.string());
            continue;
        }
        if (!link_id.empty() && json_mini::get_string(d.root, "link_id").value_or("") != link_id) continue;
        out.push_back(std::move(d));
    }
    return out;
}

json_mini::Doc Ledger::last_link_complete(const std::string& link_id) const {
    auto events = get_events(link_id);
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if (json_mini::get_string(it->root, "step_id").value_or("") == "link_complete") {
            return std::move(*it);
        }
    }
    return {};
}

json_mini::Doc Ledger::reconstruct_artifact_index() const {
    auto index = json_mini::new_object();
    for (const auto& ev : get_events()) {
        if (json_mini::get_string(ev.root, "step_id").value_or("") != "link_complete") continue;
        if (json_mini::get_string(ev.root, "status").value_or("") != "SUCCEEDED") continue;
        json_object* outputs = json_mini::get(ev.root, "outputs");
        if (!json_mini::is_object(outputs)) continue;
        json_object_object_foreach(outputs, aid, entry) {
            json_mini::put(index.root, aid, json_mini::clone(entry));
        }
    }
    return index;
}

ChainReport Ledger::verify_chain() const {
    ChainReport r;
    std::string prev = genesis_hash();
    for (const auto& line : read_lines()) {
        r.lines++;
        SplitLine s;
        if (!split_chained_line(line, &s)) {
            r.ok = false;
            r.first_bad_line = r.lines;
            r.error = "missing or malformed chain fields";
            return r;
        }
        if (s.prev != prev) {
            r.ok = false;
            r.first_bad_line = r.lines;
            r.error = "chain_prev does not match previous chain_hash";
            return r;
        }
        if (!constant_time_eq(sha256_hex(s.prev + s.record), s.hash)) {
            r.ok = false;
            r.first_bad_line = r.lines;
            r.error = "chain_hash mismatch (record altered)";
            return r;
        }
        prev = s.hash;
    }
    return r;
}

} // namespace dawn
