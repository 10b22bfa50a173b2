#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace tradesync {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isBlocked() const { return status_code == 418; }
    bool isServerError() const { return status_code >= 500; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    // Header lookup is case-insensitive; empty when absent
    std::string header(const std::string& name) const;
};

using QueryParams = std::map<std::string, std::string>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Signed requests carry timestamp, recvWindow and signature
    virtual HttpResponse get(const std::string& endpoint, const QueryParams& params = {}, bool signed_request = false) = 0;
    virtual HttpResponse post(const std::string& endpoint, const QueryParams& params, bool signed_request = true) = 0;
    virtual HttpResponse del(const std::string& endpoint, const QueryParams& params, bool signed_request = true) = 0;
};

} // namespace network
} // namespace tradesync
