#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <fstream>

#include "common/Logger.h"
#include "core/state/JournalEvents.h"

namespace tradesync {
namespace core {

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    std::string row;
    while (in.is_open() && std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        if (!parseRow(row)) {
            ++skipped_rows_;
        }
        // Rows of unknown type still hold their seq
        try {
            const auto line = nlohmann::json::parse(row);
            if (line.is_object()) {
                last_seq_ = (std::max)(last_seq_, line.value("seq", static_cast<std::uint64_t>(0)));
            }
        } catch (const nlohmann::json::exception&) {
            // torn row, already counted
        }
    }
    if (skipped_rows_ > 0) {
        // Usually a torn tail from a crash mid-append; the next append starts a fresh line
        LOG_WARN("Journal '{}': {} unreadable rows skipped", file_path_.string(), skipped_rows_);
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal '{}' cannot be opened for append", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    const nlohmann::json row = {
        {"seq", next_seq},
        {"ts_ms", event.ts_ms},
        {"type", toString(event.type)},
        {"symbol", event.symbol},
        {"entity_id", event.entity_id},
        {"payload", event.payload}
    };

    out << row.dump() << "\n";
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Journal '{}': write of {} {} failed", file_path_.string(), toString(event.type), event.entity_id);
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    skipped_rows_ = 0;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        auto event = parseRow(row);
        if (!event) {
            ++skipped_rows_;
            continue;
        }
        if (event->seq >= seq_inclusive) {
            out.push_back(std::move(*event));
        }
    }
    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::size_t EventJournalJsonl::skippedRows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skipped_rows_;
}

std::optional<JournalEvent> EventJournalJsonl::parseRow(const std::string& row) {
    nlohmann::json line;
    try {
        line = nlohmann::json::parse(row);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    if (!line.is_object()) {
        return std::nullopt;
    }

    const auto type = parseJournalEventType(line.value("type", std::string()));
    const auto seq = line.value("seq", static_cast<std::uint64_t>(0));
    if (!type || seq == 0) {
        return std::nullopt;
    }

    JournalEvent event;
    event.seq = seq;
    event.type = *type;
    event.ts_ms = line.value("ts_ms", 0LL);
    event.symbol = line.value("symbol", std::string());
    event.entity_id = line.value("entity_id", std::string());
    event.payload = line.value("payload", nlohmann::json::object());
    return event;
}

} // namespace core
} // namespace tradesync
