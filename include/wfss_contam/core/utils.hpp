#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace wfss_contam::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Parallelism: none -> 1, quarter -> cores/4, half -> cores/2, all -> cores.
// Fractions round down with a floor of one worker. Throws ConfigError for
// MaxCores::UNKNOWN.
int available_cores();
int resolve_worker_count(MaxCores max_cores, int cores);

// Runs worker(0) .. worker(n_workers - 1) on their own threads and joins them.
// If a thread cannot be started, the ones already running are joined before
// the error propagates.
template <typename Worker>
void run_workers(int n_workers, const Worker& worker) {
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(n_workers));
    try {
        for (int w = 0; w < n_workers; ++w) {
            threads.emplace_back(worker, w);
        }
    } catch (...) {
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }
    for (auto& t : threads) {
        t.join();
    }
}

// Math utilities
double sum_finite(const Matrix2Dd& data);

// String utilities
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace wfss_contam::core
