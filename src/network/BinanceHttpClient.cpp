#include "network/BinanceHttpClient.h"
#include "network/RequestSigner.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tradesync {
namespace network {
namespace {
std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int parseIntOr(const std::string& value, int fallback) {
    try {
        return value.empty() ? fallback : std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

// curl_global_init is not thread-safe; run it once per process
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensureCurlGlobal() {
    static CurlGlobal global;
    (void)global;
}
}

std::string HttpResponse::header(const std::string& name) const {
    const std::string wanted = lowerCopy(name);
    for (const auto& [key, value] : headers) {
        if (lowerCopy(key) == wanted) {
            return value;
        }
    }
    return "";
}

BinanceHttpClient::BinanceHttpClient(const engine::ExchangeConfig& config)
    : api_key_(config.api_key)
    , secret_key_(config.api_secret)
    , base_url_(config.base_url)
    , recv_window_ms_(config.recv_window_ms)
    , timeout_seconds_(config.timeout_seconds)
    , rate_limiter_(std::make_shared<execution::RateLimiter>())
{
    ensureCurlGlobal();
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

BinanceHttpClient::~BinanceHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpResponse BinanceHttpClient::get(const std::string& endpoint, const QueryParams& params, bool signed_request) {
    return send("GET", endpoint, params, signed_request);
}

HttpResponse BinanceHttpClient::post(const std::string& endpoint, const QueryParams& params, bool signed_request) {
    return send("POST", endpoint, params, signed_request);
}

HttpResponse BinanceHttpClient::del(const std::string& endpoint, const QueryParams& params, bool signed_request) {
    return send("DELETE", endpoint, params, signed_request);
}

HttpResponse BinanceHttpClient::send(const std::string& method, const std::string& endpoint,
                                     const QueryParams& params, bool signed_request) {
    if (signed_request && !hasCredentials()) {
        throw GatewayError(false, "API credentials are not configured");
    }

    rate_limiter_->acquire("weight", weightFor(method, endpoint, params));
    if (method == "POST" && endpoint == "/fapi/v1/order") {
        rate_limiter_->acquire("order");
    }

    QueryParams query = params;
    std::map<std::string, std::string> headers;
    std::string query_string;
    if (signed_request) {
        query["timestamp"] = std::to_string(utils::getCurrentTimeMs());
        query["recvWindow"] = std::to_string(recv_window_ms_);
        query_string = RequestSigner::buildQueryString(query);
        query_string += "&signature=" + RequestSigner::sign(secret_key_, query_string);
        headers["X-MBX-APIKEY"] = api_key_;
    } else {
        query_string = RequestSigner::buildQueryString(query);
    }

    std::string url = base_url_ + endpoint;
    if (!query_string.empty()) {
        url += "?" + query_string;
    }

    auto response = performRequest(method, url, headers);
    trackUsage(response);
    return response;
}

HttpResponse BinanceHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, "");
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw GatewayError(true, "CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    return response;
}

int BinanceHttpClient::weightFor(const std::string& method, const std::string& endpoint, const QueryParams& params) {
    if (endpoint == "/fapi/v2/positionRisk" || endpoint == "/fapi/v1/userTrades") return 5;
    if (endpoint == "/fapi/v1/forceOrders") return params.count("symbol") ? 20 : 50;
    if (endpoint == "/fapi/v1/premiumIndex") return params.count("symbol") ? 1 : 10;
    if (endpoint == "/fapi/v1/exchangeInfo") return 1;
    if (endpoint == "/fapi/v1/order" && method == "GET") return 1;
    return 1;
}

void BinanceHttpClient::trackUsage(const HttpResponse& response) {
    rate_limiter_->updateUsed("weight", parseIntOr(response.header("X-MBX-USED-WEIGHT-1M"), -1));
    rate_limiter_->updateUsed("order", parseIntOr(response.header("X-MBX-ORDER-COUNT-10S"), -1));

    if (response.isRateLimited() || response.isBlocked()) {
        rate_limiter_->handleRateLimitError(response.status_code, parseIntOr(response.header("Retry-After"), 0));
    }
}

size_t BinanceHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BinanceHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

} // namespace network
} // namespace tradesync
