#include "voice/transcription_client.hpp"
#include "voice/base64.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace Voice {

static bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// ============================================================
// Request / response mapping
// ============================================================
nlohmann::json buildRecognitionRequest(const PcmBuffer& pcm,
                                       unsigned sampleRate,
                                       const std::string& languageCode) {
    return {
        {"config", {
            {"encoding", "LINEAR16"},
            {"sampleRateHertz", sampleRate},
            {"languageCode", languageCode},
            {"enableAutomaticPunctuation", true}
        }},
        {"audio", {
            {"content", Base64::encode(pcm)}
        }}
    };
}

TranscriptResult parseRecognitionResponse(const HttpResponse& response) {
    if (!response.transportOk) {
        LOG_ERROR("STT", "Transport failure: " + response.error);
        return TranscriptResult::failed(VoiceError::NetworkFailure);
    }
    if (!response.ok()) {
        LOG_ERROR("STT", "API error: " + std::to_string(response.status));
        return TranscriptResult::failed(VoiceError::ServiceError, static_cast<int>(response.status));
    }

    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("STT", "Response body is not a JSON object");
        return TranscriptResult::failed(VoiceError::ParseFailure);
    }

    // Google omits "results" entirely when nothing was recognized
    if (!j.contains("results") || j["results"].is_null()) {
        return TranscriptResult::noSpeech();
    }

    const auto& results = j["results"];
    if (!results.is_array()) {
        LOG_ERROR("STT", "\"results\" is not an array");
        return TranscriptResult::failed(VoiceError::ParseFailure);
    }
    if (results.empty()) {
        return TranscriptResult::noSpeech();
    }

    const auto& first = results[0];
    if (!first.is_object() || !first.contains("alternatives") ||
        !first["alternatives"].is_array() || first["alternatives"].empty()) {
        LOG_ERROR("STT", "First result has no alternatives");
        return TranscriptResult::failed(VoiceError::ParseFailure);
    }

    const auto& alt = first["alternatives"][0];
    if (!alt.is_object() || !alt.contains("transcript") || !alt["transcript"].is_string()) {
        LOG_ERROR("STT", "First alternative has no transcript string");
        return TranscriptResult::failed(VoiceError::ParseFailure);
    }

    std::string text = alt["transcript"].get<std::string>();
    if (isBlank(text)) {
        return TranscriptResult::noSpeech();
    }
    return TranscriptResult::ready(std::move(text));
}

// ============================================================
// TranscriptionClient
// ============================================================
TranscriptionClient::TranscriptionClient(std::shared_ptr<HttpTransport> transport,
                                         WorkerPool& networkPool,
                                         EventLoop& loop,
                                         std::string recognizeUrl)
    : transport_(std::move(transport)),
      pool_(networkPool),
      loop_(loop),
      url_(std::move(recognizeUrl)) {}

bool TranscriptionClient::transcribe(SessionId session,
                                     PcmBuffer pcm,
                                     unsigned sampleRate,
                                     const std::string& languageCode,
                                     Callback callback) {
    LOG_DEBUG("STT", "Session " + std::to_string(session) + ": sending " +
                     std::to_string(pcm.size()) + " bytes at " +
                     std::to_string(sampleRate) + " Hz");

    auto job = [transport = transport_, &loop = loop_, url = url_, session,
                pcm = std::move(pcm), sampleRate, languageCode, callback]() {
        TranscriptResult result = TranscriptResult::failed(VoiceError::NetworkFailure);
        try {
            std::string body = buildRecognitionRequest(pcm, sampleRate, languageCode)
                                   .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            result = parseRecognitionResponse(transport->postJson(url, body));
        } catch (const std::exception& e) {
            LOG_ERROR("STT", "Session " + std::to_string(session) + " request failed: " + e.what());
        }

        LOG_TRACE("STT", "Session " + std::to_string(session) + " result ready, handing to loop");
        if (!loop.post([callback, session, result]() { callback(session, result); })) {
            LOG_WARN("STT", "Loop closed, transcription result for session " +
                            std::to_string(session) + " dropped");
        }
    };

    if (!pool_.submit(std::move(job)).valid()) {
        LOG_ERROR("STT", "Network pool is not accepting work");
        bool queued = loop_.post([callback, session]() {
            callback(session, TranscriptResult::failed(VoiceError::NetworkFailure));
        });
        if (!queued) {
            LOG_WARN("STT", "Loop closed, failure for session " + std::to_string(session) + " dropped");
        }
        return false;
    }
    return true;
}

} // namespace Voice
