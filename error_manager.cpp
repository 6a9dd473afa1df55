#include "error_manager.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
nlohmann::json ErrorManager::root = nlohmann::json::object();

static std::mutex rootMutex;

static std::string lookup(const std::string& code, const char* field) {
    std::lock_guard<std::mutex> lock(rootMutex);
    const nlohmann::json& table = ErrorManager::root;

    auto it = table.find(code);
    if (it == table.end() || !it->is_object()) return {};

    auto f = it->find(field);
    if (f == it->end() || !f->is_string()) return {};
    return f->get<std::string>();
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    nlohmann::json errors = nlohmann::json::parse(in, nullptr, false);
    if (errors.is_discarded() || !errors.is_object()) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path);
        return false;
    }

    use(errors);
    LOG_DEBUG("ErrorManager", "Loaded errors.json from: " + fs::absolute(path).string());

    std::string codes;
    {
        std::lock_guard<std::mutex> lock(rootMutex);
        for (auto& [key, val] : root.items()) {
            codes += key + " ";
        }
    }
    LOG_TRACE("ErrorManager", "Available error codes: " + codes);
    return true;
}

void ErrorManager::use(const nlohmann::json& table) {
    std::lock_guard<std::mutex> lock(rootMutex);
    if (table.contains("errors") && table["errors"].is_object()) {
        root = table["errors"];
    } else {
        root = table;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::string msg = lookup(code, "user");
    if (!msg.empty()) return msg;
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::string msg = lookup(code, "debug");
    if (!msg.empty()) return msg;
    return "[Debug] No debug message for code: " + code;
}

Voice::Notice ErrorManager::report(Voice::VoiceError error,
                                   const std::string& detail,
                                   int serviceCode) {
    Voice::Notice notice = report(Voice::errorCode(error), detail);
    notice.error = error;
    notice.serviceCode = serviceCode;
    if (serviceCode != 0) {
        notice.message += " (HTTP " + std::to_string(serviceCode) + ")";
    }
    return notice;
}

Voice::Notice ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string debugMsg = getDebugMessage(code);

    Voice::Notice notice;
    notice.error   = Voice::VoiceError::None;
    notice.code    = code;
    notice.message = getUserMessage(code);

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg + (detail.empty() ? "" : " [" + detail + "]"));
    return notice;
}
