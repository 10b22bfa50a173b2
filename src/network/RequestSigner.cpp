#include "network/RequestSigner.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace tradesync {
namespace network {

std::string RequestSigner::sign(const std::string& secret_key, const std::string& payload) {
    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    HMAC(EVP_sha256(),
         secret_key.c_str(), static_cast<int>(secret_key.length()),
         reinterpret_cast<const unsigned char*>(payload.c_str()), payload.length(),
         signature, &signature_len);

    return toHex(signature, signature_len);
}

std::string RequestSigner::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << urlEncode(value);
        first = false;
    }
    return oss.str();
}

std::string RequestSigner::urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string RequestSigner::toHex(const unsigned char* data, unsigned int length) {
    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

} // namespace network
} // namespace tradesync
