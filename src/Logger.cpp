/**
 * @file Logger.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace {
std::mutex g_logMtx;
std::ofstream g_log;
std::atomic<bool> g_inited{false};
std::mutex g_lastMtx;
std::string g_lastWarning;
std::atomic<int> g_level{static_cast<int>(Logger::Level::Info)};

std::string basenameFromPath(const std::string& p) {
    if (p.empty()) return std::string("orrery");
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return p;
    if (pos + 1 >= p.size()) return std::string("orrery");
    return p.substr(pos + 1);
}

std::string nowTs() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tmv;
#if defined(_WIN32)
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* levelName(Logger::Level lvl) {
    switch (lvl) {
        case Logger::Level::Debug: return "DEBUG";
        case Logger::Level::Info:  return "INFO";
        case Logger::Level::Warn:  return "WARN";
        default:                   return "ERROR";
    }
}

void setLevelFromEnv() {
    const char* s = std::getenv("LOG_LEVEL");
    if (!s) return;
    std::string v(s);
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "debug") g_level.store((int)Logger::Level::Debug);
    else if (v == "info") g_level.store((int)Logger::Level::Info);
    else if (v == "warn" || v == "warning") g_level.store((int)Logger::Level::Warn);
    else if (v == "error") g_level.store((int)Logger::Level::Error);
    else if (v == "none" || v == "off") g_level.store((int)Logger::Level::None);
}
}

void Logger::initFromArgv0(const char* argv0) {
    std::string base = basenameFromPath(argv0 ? std::string(argv0) : std::string("orrery"));
    init(std::string("./") + base + ".log");
}

void Logger::init(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_inited.load()) return;
    // Append to preserve prior runs; each run gets a session header.
    g_log.open(filename, std::ios::out | std::ios::app);
    if (g_log.is_open()) {
        g_inited.store(true);
        setLevelFromEnv();
        g_log << "===== session start " << nowTs() << " =====" << '\n';
        g_log.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_inited.load()) return;
    g_log << "===== session end   " << nowTs() << " =====" << std::endl;
    g_log.close();
    g_inited.store(false);
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    if (lvl >= Level::Warn && lvl != Level::None) {
        std::lock_guard<std::mutex> last(g_lastMtx);
        g_lastWarning = msg;
    }
    if (!enabled(lvl)) return;
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_log.is_open()) return;
    g_log << nowTs() << " [" << levelName(lvl) << "] [t:" << tid.str() << "] " << msg << '\n';
    if (lvl >= Level::Warn) g_log.flush();
}

void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }
void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::logUnknownException(const std::string& where) {
    logImpl(Level::Error, where + ": unknown exception");
}

void Logger::setLevel(Level lvl) { g_level.store((int)lvl); }
Logger::Level Logger::level() { return (Level)g_level.load(); }

bool Logger::enabled(Level lvl) {
    return g_inited.load(std::memory_order_acquire) && (int)lvl >= g_level.load() && lvl != Level::None;
}

std::string Logger::lastWarning() {
    std::lock_guard<std::mutex> last(g_lastMtx);
    return g_lastWarning;
}

void Logger::clearLastWarning() {
    std::lock_guard<std::mutex> last(g_lastMtx);
    g_lastWarning.clear();
}
