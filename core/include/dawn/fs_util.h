#pragma once

#include <filesystem>
#include <string>

namespace dawn {

// Whole file as a string. Throws std::runtime_error("cannot open: ...").
std::string slurp(const std::filesystem::path& path);

// Writes body to <dst>.tmp and renames it over dst (parents are created).
// Returns empty string on success.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body);

// Plain truncating write (parents are created). Returns empty string on success.
std::string write_file(const std::filesystem::path& dst, const std::string& body);

// "2026-10-17T08:15:02.123456Z"
std::string iso_utc_now();

// Seconds since the Unix epoch, microsecond resolution.
double epoch_now();

// hostname:pid
std::string worker_identity();

} // namespace dawn
