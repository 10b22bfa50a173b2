#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace tradesync {
namespace core {

// Position-plane audit log: emergency writes, anomalies and archived trades,
// one JSON event per line under a seq that keeps rising across restarts.
// Rows that fail to parse or carry an unknown type are skipped on read.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    // Rows skipped by the last scan or read
    std::size_t skippedRows() const;

    const std::filesystem::path& path() const { return file_path_; }

private:
    static std::optional<JournalEvent> parseRow(const std::string& row);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::size_t skipped_rows_ = 0;
};

} // namespace core
} // namespace tradesync
