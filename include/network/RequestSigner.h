#pragma once

#include <map>
#include <string>

namespace tradesync {
namespace network {

// Binance SIGNED endpoint authentication
class RequestSigner {
public:
    // Hex HMAC-SHA256 of the query string with the API secret
    static std::string sign(const std::string& secret_key, const std::string& payload);

    // key=value pairs joined with '&' in key order, values percent-encoded
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    static std::string urlEncode(const std::string& value);

private:
    static std::string toHex(const unsigned char* data, unsigned int length);
};

} // namespace network
} // namespace tradesync
