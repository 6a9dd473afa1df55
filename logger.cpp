#include "logger.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <atomic>
#include <filesystem>
#include <algorithm>
#include <cctype>

// =====================================================
// Globals
// =====================================================
PhaseInfo g_phaseInfo{};
static std::mutex g_logMutex;
static std::atomic<LogLevel> g_minLevel{LogLevel::Debug};

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

static std::ofstream g_logFile;

static thread_local std::string t_threadLabel = "main";

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

// Caller holds g_logMutex
static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }
    std::cerr << line << std::endl;
}

static void writeLevel(LogLevel level, const char* name,
                       const std::string& tag, const std::string& msg) {
    if (level < g_minLevel.load()) return;

    std::string line = "[" + nowTimestamp() + "][" + name + "][" +
                       t_threadLabel + "][" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(line);
}

// =====================================================
// Level controls
// =====================================================
LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Debug;
}

void setLogLevel(LogLevel level) {
    g_minLevel.store(level);
}

LogLevel getLogLevel() {
    return g_minLevel.load();
}

void setThreadLabel(const std::string& label) {
    t_threadLabel = label;
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo.timestamp = std::chrono::system_clock::now();
    g_phaseInfo.fileName  = basename(file);
    g_phaseInfo.phaseName = phase;
    g_phaseInfo.success   = success;

    std::ostringstream oss;
    oss << "| " << formatTimestamp(g_phaseInfo.timestamp)
        << " | " << g_phaseInfo.fileName
        << " | " << g_phaseInfo.phaseName
        << " | " << (g_phaseInfo.success ? "true" : "false")
        << " |";

    if (g_buffering) {
        g_phaseBuffer.push_back(oss.str());
    } else {
        writeLine(oss.str());
    }
}

// =====================================================
// Trace / Debug / Warn / Error Logging
// =====================================================
void logTrace(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Trace, "TRACE", tag, msg);
}

void logDebug(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Debug, "DEBUG", tag, msg);
}

void logWarn(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Warn, "WARN", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Error, "ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) {
        g_logFile.close();
    }

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== WalletVoice Log Started ====" << std::endl;
        std::string msg = "[" + nowTimestamp() + "][Logger] Writing logs to: " + logPath.string();
        std::cerr << msg << std::endl;
        g_logFile << msg << std::endl;
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== WalletVoice Log Ended ====" << std::endl;
        g_logFile.close();
    }
}
