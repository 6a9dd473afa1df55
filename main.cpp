#include "commands/commands_core.hpp"
#include "chat/chat_history.hpp"
#include "bootstrap.hpp"
#include "resources.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <iostream>
#include <mutex>
#include <string>

// stdout is shared by the REPL and the loop thread
static std::mutex g_printMutex;

static void printLine(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_printMutex);
    std::cout << text << std::endl;
}

// ============================================================
// Main entry point
// ============================================================
int main() {
    // Initialize logger (writes to walletvoice.log + stderr)
    initLogger(DEFAULT_LOG_FILE);
    LOG_PHASE("Startup begin", true);

    // Bootstrap configuration, error codes, devices and runtime
    std::unique_ptr<Runtime> runtime = runBootstrapChecks();
    g_runtime = runtime.get();
    LOG_PHASE("Bootstrap checks complete", true);

    // ============================================================
    // Notices and chat replies arrive on the loop thread
    // ============================================================
    auto printNotice = [](const Voice::Notice& n) {
        printLine((n.isError() ? "! " : "* ") + n.message);
    };
    runtime->session->addNoticeListener(printNotice);
    runtime->replies->addNoticeListener(printNotice);
    runtime->session->addStateChangeListener([](Voice::SessionState from, Voice::SessionState to) {
        LOG_DEBUG("Console", std::string("Mic state ") + Voice::sessionStateName(from) +
                             " -> " + Voice::sessionStateName(to));
    });
    runtime->chat->addEntryListener([](const Chat::ChatEntry& e) {
        std::string line = std::string(Chat::roleName(e.role)) + ": " + e.text;
        if (!e.walletLink.empty()) line += "\n  Add to wallet: " + e.walletLink;
        printLine(line);
    });

    printLine(ResponseManager::get("startup") + " Type 'help' for commands.");
    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(g_printMutex);
            std::cout << "> " << std::flush; // REPL prompt
        }
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        CommandResult result;
        {
            std::lock_guard<std::mutex> lock(g_printMutex);
            result = handleCommand(line);
        }
        if (!result.success) {
            LOG_TRACE("Console", "Command failed: " + result.errorCode);
        }
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    g_runtime = nullptr;
    shutdownRuntime(*runtime);
    runtime.reset();
    LOG_PHASE("Shutdown complete", true);

    // Close logger
    shutdownLogger();
    return 0;
}
