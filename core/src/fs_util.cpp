#include "dawn/fs_util.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace dawn {

std::string slurp(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string write_file(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) {
        std::filesystem::create_directories(dst.parent_path(), ec);
        if (ec) return "create_directories: " + ec.message();
    }
    std::ofstream f(dst, std::ios::binary | std::ios::trunc);
    if (!f) return "cannot write: " + dst.string();
    f << body;
    f.flush();
    if (!f) return "short write: " + dst.string();
    return "";
}

std::string write_atomic(const std::filesystem::path& dst, const std::string& body) {
    auto tmp = dst;
    tmp += ".tmp";
    std::string err = write_file(tmp, body);
    if (!err.empty()) return err;
    std::error_code ec;
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return "rename: " + dst.string();
    }
    return "";
}

std::string iso_utc_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto us = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, (long long)us);
    return buf;
}

double epoch_now() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count() / 1e6;
}

std::string worker_identity() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) std::snprintf(host, sizeof(host), "localhost");
    return std::string(host) + ":" + std::to_string((long long)getpid());
}

} // namespace dawn
