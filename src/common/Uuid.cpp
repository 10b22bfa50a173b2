#include "common/Uuid.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace tradesync {
namespace utils {

std::string generateUUID() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    const std::uint64_t part1 = dis(gen);
    const std::uint64_t part2 = dis(gen);

    oss << std::setw(8) << (part1 >> 32)
        << "-" << std::setw(4) << ((part1 >> 16) & 0xFFFF)
        << "-4" << std::setw(3) << (part1 & 0xFFF)
        << "-" << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000)
        << "-" << std::setw(12) << (part2 & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

} // namespace utils
} // namespace tradesync
