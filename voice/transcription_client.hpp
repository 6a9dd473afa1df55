#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "voice/event_loop.hpp"
#include "voice/http_transport.hpp"
#include "voice/voice_types.hpp"
#include "voice/worker_pool.hpp"

namespace Voice {

// ------------------------------------------------------------
// Recognition wire format
// ------------------------------------------------------------
nlohmann::json buildRecognitionRequest(const PcmBuffer& pcm,
                                       unsigned sampleRate,
                                       const std::string& languageCode);

// Map an HTTP exchange onto Ready / NoSpeech / Failed.
TranscriptResult parseRecognitionResponse(const HttpResponse& response);

/// TranscriptionClient
/// Sends one finished PCM buffer to the recognition endpoint on the network
/// pool. The callback always runs on the event loop, never on a network thread.
class TranscriptionClient {
public:
    using Callback = std::function<void(SessionId, TranscriptResult)>;

    TranscriptionClient(std::shared_ptr<HttpTransport> transport,
                        WorkerPool& networkPool,
                        EventLoop& loop,
                        std::string recognizeUrl);

    /// Returns false if the request could not be queued. The callback is
    /// still delivered (as NetworkFailure) in that case.
    bool transcribe(SessionId session,
                    PcmBuffer pcm,
                    unsigned sampleRate,
                    const std::string& languageCode,
                    Callback callback);

private:
    std::shared_ptr<HttpTransport> transport_;
    WorkerPool& pool_;
    EventLoop& loop_;
    std::string url_;
};

} // namespace Voice
