#pragma once
#include <string>

namespace Voice {

struct HttpResponse {
    bool transportOk = false;   // false: connection / timeout / TLS failure
    long status = 0;
    std::string body;
    std::string error;          // transport error text when !transportOk

    bool ok() const { return transportOk && status >= 200 && status < 300; }
};

/// Blocking JSON POST. Implementations are called from network pool threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse postJson(const std::string& url, const std::string& body) = 0;
};

/// cpr-backed transport for the Google speech endpoints.
/// A non-empty apiKey is sent as the "key" query parameter.
class CprTransport : public HttpTransport {
public:
    CprTransport(std::string apiKey, int timeoutMs);

    HttpResponse postJson(const std::string& url, const std::string& body) override;

private:
    std::string apiKey_;
    int timeoutMs_;
};

} // namespace Voice
