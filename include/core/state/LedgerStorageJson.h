#pragma once

#include <filesystem>
#include <optional>

#include "common/TimeUtils.h"
#include "core/contracts/ILedgerStorage.h"

namespace tradesync {
namespace core {

// Single JSON document on disk, replaced atomically (temp file + rename)
class LedgerStorageJson : public ILedgerStorage {
public:
    explicit LedgerStorageJson(std::filesystem::path file_path,
                               utils::ClockFn clock = utils::systemClock());

    std::optional<nlohmann::json> load() override;
    bool save(const nlohmann::json& document) override;
    std::string quarantine() override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    utils::ClockFn clock_;
};

} // namespace core
} // namespace tradesync
