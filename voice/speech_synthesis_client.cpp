#include "voice/speech_synthesis_client.hpp"
#include "voice/base64.hpp"
#include "logger.hpp"

#include <exception>
#include <utility>

namespace Voice {

// ============================================================
// Request / response mapping
// ============================================================
nlohmann::json buildSynthesisRequest(const SynthesisRequest& request) {
    return {
        {"input", {
            {"text", request.text}
        }},
        {"voice", {
            {"languageCode", request.voiceLocale},
            {"name", request.voiceName},
            {"ssmlGender", request.ssmlGender}
        }},
        {"audioConfig", {
            {"audioEncoding", request.audioEncoding},
            {"sampleRateHertz", request.sampleRate}
        }}
    };
}

SynthesisResult parseSynthesisResponse(const HttpResponse& response, unsigned sampleRate) {
    if (!response.transportOk) {
        LOG_ERROR("TTS", "Transport failure: " + response.error);
        return SynthesisResult::failed(VoiceError::NetworkFailure);
    }
    if (!response.ok()) {
        LOG_ERROR("TTS", "API error: " + std::to_string(response.status));
        return SynthesisResult::failed(VoiceError::ServiceError, static_cast<int>(response.status));
    }

    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("TTS", "Response body is not a JSON object");
        return SynthesisResult::failed(VoiceError::ParseFailure);
    }
    if (!j.contains("audioContent") || !j["audioContent"].is_string()) {
        LOG_ERROR("TTS", "Response has no audioContent");
        return SynthesisResult::failed(VoiceError::ParseFailure);
    }

    auto pcm = Base64::decode(j["audioContent"].get<std::string>());
    if (!pcm) {
        LOG_ERROR("TTS", "audioContent is not valid base64");
        return SynthesisResult::failed(VoiceError::ParseFailure);
    }

    LOG_DEBUG("TTS", "Decoded " + std::to_string(pcm->size()) + " bytes of audio");
    return SynthesisResult::ready(std::move(*pcm), sampleRate);
}

// ============================================================
// SpeechSynthesisClient
// ============================================================
SpeechSynthesisClient::SpeechSynthesisClient(std::shared_ptr<HttpTransport> transport,
                                             WorkerPool& networkPool,
                                             EventLoop& loop,
                                             std::string synthesizeUrl)
    : transport_(std::move(transport)),
      pool_(networkPool),
      loop_(loop),
      url_(std::move(synthesizeUrl)) {}

bool SpeechSynthesisClient::synthesize(const SynthesisRequest& request, Callback callback) {
    LOG_DEBUG("TTS", "Synthesizing " + std::to_string(request.text.size()) + " chars with " +
                     request.voiceName + " at " + std::to_string(request.sampleRate) + " Hz");

    auto job = [transport = transport_, &loop = loop_, url = url_, request, callback]() {
        SynthesisResult result = SynthesisResult::failed(VoiceError::NetworkFailure);
        try {
            // text from a non-UTF-8 console still goes out, with U+FFFD in place of bad bytes
            std::string body = buildSynthesisRequest(request)
                                   .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            result = parseSynthesisResponse(transport->postJson(url, body), request.sampleRate);
        } catch (const std::exception& e) {
            LOG_ERROR("TTS", std::string("Request failed: ") + e.what());
        }

        if (!loop.post([callback, result = std::move(result)]() { callback(result); })) {
            LOG_WARN("TTS", "Loop closed, synthesis result dropped");
        }
    };

    if (!pool_.submit(std::move(job)).valid()) {
        LOG_ERROR("TTS", "Network pool is not accepting work");
        bool queued = loop_.post([callback]() {
            callback(SynthesisResult::failed(VoiceError::NetworkFailure));
        });
        if (!queued) {
            LOG_WARN("TTS", "Loop closed, synthesis failure dropped");
        }
        return false;
    }
    return true;
}

} // namespace Voice
