#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace tradesync {
namespace core {

// Raised by load() when the stored document exists but cannot be used
class LedgerCorruptError : public std::runtime_error {
public:
    explicit LedgerCorruptError(const std::string& message) : std::runtime_error(message) {}
};

// Whole-document persistence for the trade ledger
class ILedgerStorage {
public:
    virtual ~ILedgerStorage() = default;

    // nullopt when nothing has been stored yet
    virtual std::optional<nlohmann::json> load() = 0;
    virtual bool save(const nlohmann::json& document) = 0;

    // Moves an unusable document out of the way. Returns where it went, empty if nothing moved.
    virtual std::string quarantine() = 0;
};

} // namespace core
} // namespace tradesync
