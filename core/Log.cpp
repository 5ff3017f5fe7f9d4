#include "Log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace triplog {

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_outputMutex;
}

void Log::setLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel Log::level() {
    return g_level.load();
}

bool Log::parseLevel(const std::string& text, LogLevel& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") out = LogLevel::Debug;
    else if (lower == "info") out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
    else if (lower == "error") out = LogLevel::Error;
    else if (lower == "off" || lower == "none") out = LogLevel::Off;
    else return false;
    return true;
}

void Log::debug(const std::string& tag, const std::string& message) {
    write(LogLevel::Debug, tag, message);
}

void Log::info(const std::string& tag, const std::string& message) {
    write(LogLevel::Info, tag, message);
}

void Log::warn(const std::string& tag, const std::string& message) {
    write(LogLevel::Warn, tag, message);
}

void Log::error(const std::string& tag, const std::string& message) {
    write(LogLevel::Error, tag, message);
}

void Log::write(LogLevel level, const std::string& tag, const std::string& message) {
    if (level < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (level >= LogLevel::Warn) {
        std::cerr << "[" << tag << "] " << message << std::endl;
    } else {
        std::cout << "[" << tag << "] " << message << std::endl;
    }
}

} // namespace triplog
