#include "codecstore/reporting.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace codecstore {
namespace reporting {

static std::atomic<bool> g_csv{false};
static std::atomic<bool> g_debug{false};
static std::mutex g_io;

void set_csv(bool value) {
    g_csv.store(value, std::memory_order_relaxed);
}

bool csv_enabled() {
    return g_csv.load(std::memory_order_relaxed);
}

void set_debug(bool value) {
    g_debug.store(value, std::memory_order_relaxed);
}

bool debug_enabled() {
    static const bool env_debug = [] {
        const char* env = std::getenv("CODECSTORE_DEBUG");
        return env && std::strcmp(env, "0") != 0 && env[0] != '\0';
    }();
    return env_debug || g_debug.load(std::memory_order_relaxed);
}

void info(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] " << msg << "\n";
}

void warn(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] warning: " << msg << "\n";
}

void error(const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] error: " << msg << "\n";
}

void debug(const char* tag, const std::string& msg) {
    if (!debug_enabled()) return;
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] [debug] " << msg << "\n";
}

} // namespace reporting
} // namespace codecstore
