#include "core/adapters/JournaledAnomalyNotifier.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/JournalEvents.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "tradesync_test_event_journal";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "journal.jsonl";

    tradesync::core::EventJournalJsonl journal(path);

    tradesync::core::JournalEvent first;
    first.ts_ms = 1000;
    first.type = tradesync::core::JournalEventType::EMERGENCY_WRITE;
    first.symbol = "BTCUSDT";
    first.entity_id = "trade-1";
    first.payload["reason"] = "read-back mismatch";

    tradesync::core::JournalEvent second;
    second.ts_ms = 2000;
    second.type = tradesync::core::JournalEventType::TRADE_ARCHIVED;
    second.symbol = "ETHUSDT";
    second.entity_id = "trade-2";
    second.payload["quantity"] = 0.01;

    if (!journal.append(first)) {
        std::cerr << "[TEST] append(first) failed\n";
        return 1;
    }
    if (!journal.append(second)) {
        std::cerr << "[TEST] append(second) failed\n";
        return 1;
    }

    if (journal.lastSeq() != 2) {
        std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
        return 1;
    }

    const auto rows = journal.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
        return 1;
    }
    if (rows.front().symbol != "ETHUSDT" ||
        rows.front().type != tradesync::core::JournalEventType::TRADE_ARCHIVED) {
        std::cerr << "[TEST] unexpected row: " << rows.front().symbol << "\n";
        return 1;
    }

    // Sequence continues across reopen
    {
        tradesync::core::EventJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }
    }

    // Anomaly notifier writes through to its journal
    {
        auto anomalies = std::make_shared<tradesync::core::EventJournalJsonl>(dir / "anomalies.jsonl");
        tradesync::core::JournaledAnomalyNotifier notifier(anomalies, []() { return 5000LL; });

        nlohmann::json payload;
        payload["trade_id"] = "trade-9";
        payload["symbol"] = "BTCUSDT";
        notifier.notify(tradesync::core::AnomalyType::ORPHAN_DETECTED, payload);
        notifier.notify(tradesync::core::AnomalyType::ORPHAN_CLEARED, payload);

        const auto events = anomalies->readFrom(1);
        if (events.size() != 2) {
            std::cerr << "[TEST] expected 2 anomaly rows, got " << events.size() << "\n";
            return 1;
        }
        if (events[0].type != tradesync::core::JournalEventType::ANOMALY ||
            events[0].entity_id != "trade-9" ||
            events[0].payload.value("anomaly", "") != "ORPHAN_DETECTED" ||
            events[1].payload.value("anomaly", "") != "ORPHAN_CLEARED") {
            std::cerr << "[TEST] unexpected anomaly rows\n";
            return 1;
        }
        if (notifier.count(tradesync::core::AnomalyType::ORPHAN_DETECTED) != 1) {
            std::cerr << "[TEST] notifier count mismatch\n";
            return 1;
        }
    }

    // Typed events carry the full record and read back as one
    {
        tradesync::core::TradeRecord record;
        record.trade_id = "trade-7";
        record.strategy_name = "alpha";
        record.symbol = "BTCUSDT";
        record.side = tradesync::PositionSide::SHORT;
        record.quantity = 2.0;
        record.entry_price = 50.0;
        record.leverage = 4.0;
        record.margin_used = 25.0;
        record.status = tradesync::TradeStatus::OPEN;
        record.entry_time = 1000;

        tradesync::core::EventJournalJsonl typed(dir / "typed.jsonl");
        if (!typed.append(tradesync::core::emergencyWriteEvent(record, "save failed", 3000)) ||
            !typed.append(tradesync::core::archivedTradeEvent(record, 4000))) {
            std::cerr << "[TEST] typed append failed\n";
            return 1;
        }
        nlohmann::json detail;
        detail["key"] = "BTCUSDT:SHORT";
        if (!typed.append(tradesync::core::anomalyEvent(tradesync::core::AnomalyType::GHOST_DETECTED, detail, 5000))) {
            std::cerr << "[TEST] anomaly append failed\n";
            return 1;
        }

        const auto events = typed.readFrom(1);
        if (events.size() != 3) {
            std::cerr << "[TEST] expected 3 typed rows, got " << events.size() << "\n";
            return 1;
        }
        const auto journaled = tradesync::core::tradeFromEvent(events[0]);
        if (!journaled || !(*journaled == record) ||
            events[0].payload.value("reason", "") != "save failed" ||
            events[0].symbol != "BTCUSDT") {
            std::cerr << "[TEST] emergency event does not carry the record\n";
            return 1;
        }
        const auto archived = tradesync::core::tradeFromEvent(events[1]);
        if (!archived || !(*archived == record) || events[1].entity_id != "trade-7") {
            std::cerr << "[TEST] archive event does not carry the record\n";
            return 1;
        }
        if (tradesync::core::tradeFromEvent(events[2]) ||
            tradesync::core::anomalyFromEvent(events[2]) != tradesync::core::AnomalyType::GHOST_DETECTED ||
            events[2].entity_id != "BTCUSDT:SHORT") {
            std::cerr << "[TEST] anomaly event mismatch\n";
            return 1;
        }

        // A record filed under another entity is not trusted
        auto mislabeled = events[0];
        mislabeled.entity_id = "trade-8";
        if (tradesync::core::tradeFromEvent(mislabeled)) {
            std::cerr << "[TEST] mislabeled event should not yield a record\n";
            return 1;
        }
    }

    // Torn and unknown rows are skipped; seq continues past the highest one written
    {
        const auto mixed_path = dir / "mixed.jsonl";
        {
            std::ofstream out(mixed_path, std::ios::binary);
            out << R"({"seq":1,"ts_ms":1,"type":"ANOMALY","symbol":"","entity_id":"k","payload":{"anomaly":"ORPHAN_DETECTED"}})" << "\n";
            out << R"({"seq":2,"ts_ms":2,"type":"POSITION_OPENED","symbol":"","entity_id":"k","payload":{}})" << "\n";
            out << R"({"seq":3,"ts_ms":3,"type":"EMERGENCY_WR)" << "\n";
        }
        tradesync::core::EventJournalJsonl mixed(mixed_path);
        if (mixed.lastSeq() != 2 || mixed.skippedRows() != 2) {
            std::cerr << "[TEST] mixed journal: lastSeq " << mixed.lastSeq()
                      << ", skipped " << mixed.skippedRows() << "\n";
            return 1;
        }
        tradesync::core::JournalEvent next;
        next.type = tradesync::core::JournalEventType::ANOMALY;
        next.entity_id = "k";
        if (!mixed.append(next) || mixed.readFrom(1).size() != 2 || mixed.lastSeq() != 3) {
            std::cerr << "[TEST] append after skipped rows failed\n";
            return 1;
        }
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
