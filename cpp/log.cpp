#include "log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace txguard {
namespace log {

namespace {
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mutex;
}

void set_level(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool enabled(Level level) {
    return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

bool parse_level(const std::string& name, Level& out) {
    if (name == "debug") out = Level::Debug;
    else if (name == "info") out = Level::Info;
    else if (name == "warn") out = Level::Warn;
    else if (name == "error") out = Level::Error;
    else return false;
    return true;
}

void write(Level level, const char* tag, const std::string& message) {
    if (!enabled(level)) return;
    std::ostringstream line;
    line << "[" << tag << "] " << message << "\n";
    std::lock_guard<std::mutex> lk(g_write_mutex);
    std::cerr << line.str() << std::flush;
}

} // namespace log
} // namespace txguard
