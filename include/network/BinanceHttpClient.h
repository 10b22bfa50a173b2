#pragma once

#include "network/IHttpClient.h"
#include "execution/RateLimiter.h"
#include "engine/EngineConfig.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace tradesync {
namespace network {

// libcurl transport for the USDT-M futures REST API.
// Transport failures throw GatewayError(transient); HTTP errors are returned.
class BinanceHttpClient : public IHttpClient {
public:
    explicit BinanceHttpClient(const engine::ExchangeConfig& config);
    ~BinanceHttpClient();

    BinanceHttpClient(const BinanceHttpClient&) = delete;
    BinanceHttpClient& operator=(const BinanceHttpClient&) = delete;

    HttpResponse get(const std::string& endpoint, const QueryParams& params = {}, bool signed_request = false) override;
    HttpResponse post(const std::string& endpoint, const QueryParams& params, bool signed_request = true) override;
    HttpResponse del(const std::string& endpoint, const QueryParams& params, bool signed_request = true) override;

    bool hasCredentials() const { return !api_key_.empty() && !secret_key_.empty(); }

private:
    HttpResponse send(const std::string& method, const std::string& endpoint,
                      const QueryParams& params, bool signed_request);

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::map<std::string, std::string>& headers
    );

    static int weightFor(const std::string& method, const std::string& endpoint, const QueryParams& params);
    void trackUsage(const HttpResponse& response);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string api_key_;
    std::string secret_key_;
    std::string base_url_;
    long long recv_window_ms_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace tradesync
