#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log levels
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Warn,
    Error
};

// Parse "trace" / "debug" / "warn" / "error" (unknown -> Debug)
LogLevel parseLogLevel(const std::string& name);

// Lines below this level are dropped (phases are always written)
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success;            // true = success, false = failure
};

// Most recent phase
extern PhaseInfo g_phaseInfo;

// =====================================================
// Thread labels
// =====================================================
// Short name printed with every line from the calling thread
// ("main", "loop", "capture", "playback", "network").
void setThreadLabel(const std::string& label);

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logTrace(const std::string& tag, const std::string& msg);
void logDebug(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_WARN(tag, msg) logWarn(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
