#include "sentiment/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <utility>

namespace sentiment {
namespace log {

namespace {

std::atomic<int> gLevel{static_cast<int>(Level::Info)};
std::mutex gWriteMutex;
Sink gSink;

} // namespace

bool parseLevel(const std::string& name, Level& out) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "debug") { out = Level::Debug; return true; }
    if (n == "info") { out = Level::Info; return true; }
    if (n == "warning" || n == "warn") { out = Level::Warning; return true; }
    if (n == "error") { out = Level::Error; return true; }
    return false;
}

const char* levelName(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

void setLevel(Level level) {
    gLevel.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(gLevel.load());
}

bool enabled(Level level) {
    return static_cast<int>(level) >= gLevel.load();
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(gWriteMutex);
    gSink = std::move(sink);
}

std::string escapeControl(const std::string& message) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(message.size());
    for (unsigned char ch : message) {
        if (ch < 0x20 || ch == 0x7F) {
            out += "\\x";
            out += hex[ch >> 4];
            out += hex[ch & 0x0F];
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
    return out;
}

void write(Level level, const std::string& message) {
    if (!enabled(level)) return;

    std::string line;
    line.reserve(message.size() + 12);
    line += '[';
    line += levelName(level);
    line += "] ";
    line += escapeControl(message);

    std::lock_guard<std::mutex> lock(gWriteMutex);
    if (gSink) {
        gSink(level, line);
        return;
    }
    line += '\n';
    auto& out = level >= Level::Warning ? std::cerr : std::cout;
    out << line;
    out.flush();
}

} // namespace log
} // namespace sentiment
