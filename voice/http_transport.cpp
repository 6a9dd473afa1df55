#include "voice/http_transport.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>

namespace Voice {

CprTransport::CprTransport(std::string apiKey, int timeoutMs)
    : apiKey_(std::move(apiKey)), timeoutMs_(timeoutMs) {}

HttpResponse CprTransport::postJson(const std::string& url, const std::string& body) {
    cpr::Parameters params{};
    if (!apiKey_.empty()) {
        params.Add({"key", apiKey_});
    }

    LOG_TRACE("Http", "POST " + url + " (" + std::to_string(body.size()) + " bytes)");

    cpr::Response r = cpr::Post(
        cpr::Url{url},
        params,
        cpr::Header{{"Content-Type", "application/json; charset=utf-8"}},
        cpr::Body{body},
        cpr::Timeout{timeoutMs_});

    HttpResponse out;
    if (r.error.code != cpr::ErrorCode::OK) {
        out.transportOk = false;
        out.error = r.error.message;
        LOG_ERROR("Http", "POST " + url + " failed: " + r.error.message);
        return out;
    }

    out.transportOk = true;
    out.status = r.status_code;
    out.body = std::move(r.text);
    LOG_TRACE("Http", "POST " + url + " -> " + std::to_string(out.status) +
                      " (" + std::to_string(out.body.size()) + " bytes)");
    return out;
}

} // namespace Voice
