#include "log.hpp"
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_log_mtx;
static std::string g_log_path;
static std::atomic<bool> g_verbose{false};

static void write_line(const char* level, const std::string& s) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::string line = std::string("[Flight] ") + level + s;
    std::cerr << line << "\n";
    if (g_log_path.empty()) return;
    std::ofstream out(g_log_path, std::ios::out | std::ios::app);
    if (!out) return;
    out << line << '\n';
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
}

void set_verbose_logging(bool enabled) { g_verbose.store(enabled, std::memory_order_release); }
bool verbose_logging() { return g_verbose.load(std::memory_order_acquire); }

void log_info(const std::string& s) { write_line("", s); }
void log_warn(const std::string& s) { write_line("WARN: ", s); }

void log_verbose(const std::string& s) {
    if (!verbose_logging()) return;
    write_line("", s);
}
