#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <chrono>

Runtime* g_runtime = nullptr;

Runtime::~Runtime() {
    shutdownRuntime(*this);
}

std::unique_ptr<Runtime> buildRuntime(const bootstrap_config::VoiceConfig& config,
                                      Voice::CaptureDeviceFactory captureDevices,
                                      Voice::PlaybackDeviceFactory playbackDevices,
                                      std::shared_ptr<Voice::HttpTransport> speechTransport,
                                      std::shared_ptr<Voice::HttpTransport> chatTransport) {
    auto rt = std::make_unique<Runtime>();
    rt->config = config;

    // Threads
    rt->loop         = std::make_unique<Voice::EventLoop>("loop");
    rt->capturePool  = std::make_unique<Voice::WorkerPool>("capture", 1);
    rt->playbackPool = std::make_unique<Voice::WorkerPool>("playback", 1);
    rt->networkPool  = std::make_unique<Voice::WorkerPool>("network", config.networkWorkers);

    rt->speechTransport = std::move(speechTransport);
    rt->chatTransport   = std::move(chatTransport);

    // Chat side
    rt->permissions = std::make_unique<Voice::ConfigPermissionGate>(config.microphonePermission);
    rt->history     = std::make_unique<Chat::ChatHistory>();
    rt->chat        = std::make_unique<Chat::ConsoleChat>(*rt->history, rt->chatTransport,
                                                          *rt->networkPool, *rt->loop,
                                                          config.chatBackendUrl);

    // Voice side
    rt->capture = std::make_unique<Voice::AudioCaptureController>(
        std::move(captureDevices), *rt->capturePool, config.chunkMs,
        std::chrono::milliseconds(config.stopTimeoutMs));
    rt->playback = std::make_unique<Voice::AudioPlaybackController>(
        std::move(playbackDevices), *rt->playbackPool, config.chunkMs);
    rt->transcriber = std::make_unique<Voice::TranscriptionClient>(
        rt->speechTransport, *rt->networkPool, *rt->loop, config.recognizeUrl);
    rt->synthesizer = std::make_unique<Voice::SpeechSynthesisClient>(
        rt->speechTransport, *rt->networkPool, *rt->loop, config.synthesizeUrl);

    Voice::VoiceSessionSettings settings;
    settings.format = config.captureFormat;
    settings.languageCode = config.speechLanguage;

    rt->session = std::make_unique<Voice::VoiceSessionStateMachine>(
        *rt->loop, *rt->capture, *rt->transcriber, *rt->chat, *rt->permissions, settings);
    rt->replies = std::make_unique<Voice::ReplyPlayer>(
        *rt->loop, *rt->synthesizer, *rt->playback, *rt->chat, config.voice);

    return rt;
}

void shutdownRuntime(Runtime& rt) {
    if (rt.stopped) return;
    rt.stopped = true;

    LOG_PHASE("Runtime shutdown begin", true);

    if (rt.session) rt.session->shutdown();
    if (rt.replies) rt.replies->shutdown();
    if (rt.loop) rt.loop->flush();

    // Joins in-flight work; results they post are stale by now
    if (rt.capturePool)  rt.capturePool->shutdown();
    if (rt.networkPool)  rt.networkPool->shutdown();
    if (rt.playbackPool) rt.playbackPool->shutdown();

    if (rt.loop) rt.loop->shutdown();

    LOG_PHASE("Runtime shutdown complete", true);
}

std::unique_ptr<Runtime> runBootstrapChecks() {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    beginPhaseGroup();
    bootstrap_config::VoiceConfig cfg = bootstrap_config::initAll();
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    setLogLevel(parseLogLevel(cfg.logLevel));
    if (!cfg.logFile.empty() && cfg.logFile != DEFAULT_LOG_FILE) {
        LOG_DEBUG("Config", "Switching log file to " + cfg.logFile);
        initLogger(cfg.logFile);
    }

    // ============================================================
    // Audio devices
    // ============================================================
    auto devices = Voice::listAudioDevices();
    bool haveInput = false;
    for (const auto& d : devices) {
        LOG_DEBUG("Devices", "[" + std::to_string(d.index) + "] " + d.name + " (" + d.hostApi +
                             ", in=" + std::to_string(d.maxInputChannels) +
                             ", out=" + std::to_string(d.maxOutputChannels) + ")" +
                             (d.isDefaultInput ? " [default input]" : ""));
        if (d.maxInputChannels > 0 &&
            (cfg.inputDeviceIndex < 0 || cfg.inputDeviceIndex == d.index)) {
            haveInput = true;
        }
    }
    if (!haveInput) {
        LOG_WARN("Devices", "No usable input device (input_device_index=" +
                            std::to_string(cfg.inputDeviceIndex) + "), voice input will fail");
    }
    LOG_PHASE("Audio device scan", haveInput);

    // ============================================================
    // Runtime
    // ============================================================
    int inputIndex = cfg.inputDeviceIndex;
    auto transport = std::make_shared<Voice::CprTransport>(cfg.googleApiKey, cfg.networkTimeoutMs);
    auto chatTransport = std::make_shared<Voice::CprTransport>("", cfg.networkTimeoutMs);

    auto rt = buildRuntime(cfg,
                           [inputIndex]() { return Voice::makePortAudioCaptureDevice(inputIndex); },
                           []() { return Voice::makeSfmlPlaybackDevice(); },
                           transport, chatTransport);
    LOG_PHASE("Runtime started", true);

    // ============================================================
    // Bootstrap complete
    // ============================================================
    LOG_PHASE("Bootstrap complete", true);
    return rt;
}
