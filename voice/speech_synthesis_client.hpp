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

nlohmann::json buildSynthesisRequest(const SynthesisRequest& request);

// audioContent is base64 LINEAR16; sampleRate is the rate that was requested.
SynthesisResult parseSynthesisResponse(const HttpResponse& response, unsigned sampleRate);

/// SpeechSynthesisClient
/// Text in, PCM out. Runs the request on the network pool and delivers the
/// result on the event loop.
class SpeechSynthesisClient {
public:
    using Callback = std::function<void(SynthesisResult)>;

    SpeechSynthesisClient(std::shared_ptr<HttpTransport> transport,
                          WorkerPool& networkPool,
                          EventLoop& loop,
                          std::string synthesizeUrl);

    bool synthesize(const SynthesisRequest& request, Callback callback);

private:
    std::shared_ptr<HttpTransport> transport_;
    WorkerPool& pool_;
    EventLoop& loop_;
    std::string url_;
};

} // namespace Voice
