#pragma once
#include <memory>

#include "bootstrap_config.hpp"
#include "chat/chat_history.hpp"
#include "chat/console_chat.hpp"
#include "voice/audio_capture.hpp"
#include "voice/audio_devices.hpp"
#include "voice/audio_playback.hpp"
#include "voice/event_loop.hpp"
#include "voice/http_transport.hpp"
#include "voice/permission_gate.hpp"
#include "voice/reply_player.hpp"
#include "voice/speech_synthesis_client.hpp"
#include "voice/transcription_client.hpp"
#include "voice/voice_session.hpp"
#include "voice/worker_pool.hpp"

// ------------------------------------------------------------
// Runtime: everything the console drives. Members are declared in
// construction order; shutdownRuntime() tears them down in the safe order.
// ------------------------------------------------------------
struct Runtime {
    ~Runtime();

    bootstrap_config::VoiceConfig config;

    std::unique_ptr<Voice::EventLoop> loop;
    std::unique_ptr<Voice::WorkerPool> capturePool;
    std::unique_ptr<Voice::WorkerPool> playbackPool;
    std::unique_ptr<Voice::WorkerPool> networkPool;

    std::shared_ptr<Voice::HttpTransport> speechTransport;
    std::shared_ptr<Voice::HttpTransport> chatTransport;

    std::unique_ptr<Voice::ConfigPermissionGate> permissions;
    std::unique_ptr<Chat::ChatHistory> history;
    std::unique_ptr<Chat::ConsoleChat> chat;

    std::unique_ptr<Voice::AudioCaptureController> capture;
    std::unique_ptr<Voice::AudioPlaybackController> playback;
    std::unique_ptr<Voice::TranscriptionClient> transcriber;
    std::unique_ptr<Voice::SpeechSynthesisClient> synthesizer;

    std::unique_ptr<Voice::VoiceSessionStateMachine> session;
    std::unique_ptr<Voice::ReplyPlayer> replies;

    bool stopped = false;
};

// Devices and transports are injected so tests can run the whole graph
std::unique_ptr<Runtime> buildRuntime(const bootstrap_config::VoiceConfig& config,
                                      Voice::CaptureDeviceFactory captureDevices,
                                      Voice::PlaybackDeviceFactory playbackDevices,
                                      std::shared_ptr<Voice::HttpTransport> speechTransport,
                                      std::shared_ptr<Voice::HttpTransport> chatTransport);

// Configs, error codes, device listing, then the production runtime
std::unique_ptr<Runtime> runBootstrapChecks();

// state machine -> reply player -> loop flush -> pools -> loop. Idempotent.
void shutdownRuntime(Runtime& rt);

// The runtime the console commands act on
extern Runtime* g_runtime;
