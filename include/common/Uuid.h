#pragma once

#include <string>

namespace tradesync {
namespace utils {

// Random RFC 4122 version 4 identifier, 36 characters
std::string generateUUID();

} // namespace utils
} // namespace tradesync
