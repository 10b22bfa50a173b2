#include "core/state/EventJournalJsonl.h"
#include "core/state/JournalEvents.h"
#include "core/state/LedgerStorageJson.h"
#include "core/state/TradeLedger.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>

using namespace tradesync;
using namespace tradesync::core;

namespace {
constexpr long long kHour = 60LL * 60LL * 1000LL;
constexpr long long kDay = 24LL * kHour;

class RecordingNotifier : public IAnomalyNotifier {
public:
    void notify(AnomalyType type, const nlohmann::json& payload) override {
        ++counts[type];
        last_payload = payload;
    }
    std::map<AnomalyType, int> counts;
    nlohmann::json last_payload;
};

// Keeps the document in memory; can be told to fail the next saves
class FlakyStorage : public ILedgerStorage {
public:
    std::optional<nlohmann::json> load() override {
        if (!document) return std::nullopt;
        return document;
    }
    bool save(const nlohmann::json& doc) override {
        ++save_calls;
        if (fail_saves > 0) {
            --fail_saves;
            return false;
        }
        document = doc;
        return true;
    }
    std::string quarantine() override {
        document.reset();
        return "memory";
    }

    std::optional<nlohmann::json> document;
    int fail_saves = 0;
    int save_calls = 0;
};

TradeRecord makeRecord(const std::string& id, const std::string& strategy, TradeStatus status, long long entry_time) {
    TradeRecord r;
    r.trade_id = id;
    r.strategy_name = strategy;
    r.symbol = "BTCUSDT";
    r.side = PositionSide::LONG;
    r.quantity = 1.0;
    r.entry_price = 100.0;
    r.leverage = 5.0;
    r.margin_used = 20.0;
    r.stop_loss = 95.0;
    r.status = status;
    r.entry_time = entry_time;
    return r;
}

std::filesystem::path freshDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("tradesync_test_" + name);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

LedgerOptions fastOptions() {
    LedgerOptions options;
    options.retry_backoff_ms = 0;
    return options;
}
} // namespace

int main() {
    assert(utils::formatIsoUtc(0) == "1970-01-01T00:00:00.000Z");
    assert(utils::formatIsoUtc(1700000000123LL) == "2023-11-14T22:13:20.123Z");

    long long now = 10 * kDay;
    auto clock = [&now]() { return now; };

    // put/get round trip survives a reload from disk
    {
        const auto dir = freshDir("ledger_roundtrip");
        auto storage = std::make_shared<LedgerStorageJson>(dir / "trades.json", clock);
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.load();

        auto record = makeRecord("t-1", "alpha", TradeStatus::PENDING, now);
        record.take_profit = 110.0;
        record.parent_trade_id = std::string("t-0");
        assert(ledger.put(record).ok);
        assert(ledger.get("t-1").has_value());
        assert(*ledger.get("t-1") == record);

        TradeLedger reloaded(storage, fastOptions(), nullptr, nullptr, clock);
        reloaded.load();
        auto back = reloaded.get("t-1");
        assert(back.has_value());
        assert(*back == record);
        assert(!reloaded.get("missing").has_value());
    }

    // At most one active record per strategy
    {
        auto storage = std::make_shared<FlakyStorage>();
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.load();

        assert(ledger.put(makeRecord("a-1", "alpha", TradeStatus::PENDING, now)).ok);
        auto dup = ledger.put(makeRecord("a-2", "alpha", TradeStatus::OPEN, now));
        assert(!dup.ok && !dup.degraded);
        assert(dup.kind == ErrorKind::INVARIANT_VIOLATION);
        assert(!ledger.get("a-2").has_value());

        // terminal records do not count, other strategies are independent
        assert(ledger.put(makeRecord("a-0", "alpha", TradeStatus::CLOSED, now - kHour)).ok);
        assert(ledger.put(makeRecord("b-1", "beta", TradeStatus::OPEN, now)).ok);

        // unattributed ghosts may pile up
        assert(ledger.put(makeRecord("u-1", kUnattributedStrategy, TradeStatus::GHOST_ADOPTED, now)).ok);
        assert(ledger.put(makeRecord("u-2", kUnattributedStrategy, TradeStatus::GHOST_ADOPTED, now)).ok);

        // the same trade_id with different content is rejected
        auto changed = makeRecord("a-1", "alpha", TradeStatus::PENDING, now);
        changed.quantity = 2.0;
        assert(!ledger.put(changed).ok);
    }

    // update: idempotence, forward-only status, immutable economics
    {
        auto storage = std::make_shared<FlakyStorage>();
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.load();
        assert(ledger.put(makeRecord("t-2", "alpha", TradeStatus::PENDING, now)).ok);

        // fill data may still change while PENDING
        TradeUpdate fill;
        fill.status = TradeStatus::OPEN;
        fill.entry_price = 101.0;
        fill.quantity = 0.99;
        fill.margin_used = 101.0 * 0.99 / 5.0;
        fill.exchange_order_ref = std::string("8389765");
        assert(ledger.update("t-2", fill).ok);
        const auto after_first = *ledger.get("t-2");

        const int saves_before = storage->save_calls;
        assert(ledger.update("t-2", fill).ok);
        assert(*ledger.get("t-2") == after_first);
        assert(storage->save_calls == saves_before);

        TradeUpdate back;
        back.status = TradeStatus::PENDING;
        auto r = ledger.update("t-2", back);
        assert(!r.ok && r.kind == ErrorKind::INVARIANT_VIOLATION);

        TradeUpdate orphan;
        orphan.status = TradeStatus::ORPHANED;
        assert(!ledger.update("t-2", orphan).ok);

        TradeUpdate resize;
        resize.quantity = 2.0;
        r = ledger.update("t-2", resize);
        assert(!r.ok && r.kind == ErrorKind::INVARIANT_VIOLATION);
        assert(ledger.get("t-2")->quantity == 0.99);

        TradeUpdate close;
        close.status = TradeStatus::CLOSED;
        close.exit_price = 110.0;
        close.exit_time = now + 1000;
        close.exit_reason = std::string("signal-exit");
        assert(ledger.update("t-2", close).ok);

        TradeUpdate reopen;
        reopen.status = TradeStatus::OPEN;
        assert(!ledger.update("t-2", reopen).ok);
        assert(!ledger.update("unknown", close).ok);

        // a closed record is final; repeating the same close is still fine
        assert(ledger.update("t-2", close).ok);
        TradeUpdate rewrite;
        rewrite.status = TradeStatus::CLOSED;
        rewrite.exit_reason = std::string("rewritten");
        rewrite.pnl_absolute = -999.0;
        r = ledger.update("t-2", rewrite);
        assert(!r.ok && r.kind == ErrorKind::INVARIANT_VIOLATION);
        const auto final_close = *ledger.get("t-2");
        assert(final_close.exit_reason == "signal-exit");
        assert(!final_close.pnl_absolute.has_value());
        assert(*final_close.exit_price == 110.0);

        assert(ledger.put(makeRecord("t-4", "beta", TradeStatus::PENDING, now)).ok);
        TradeUpdate orphan_pending;
        orphan_pending.status = TradeStatus::ORPHANED;
        orphan_pending.exit_reason = std::string("orphan-pending-unconfirmed");
        assert(ledger.update("t-4", orphan_pending).ok);
        TradeUpdate late_exit;
        late_exit.exit_time = now + 5000;
        assert(!ledger.update("t-4", late_exit).ok);
        assert(!ledger.get("t-4")->exit_time.has_value());
    }

    // Tolerant find
    {
        auto storage = std::make_shared<FlakyStorage>();
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.load();

        assert(ledger.put(makeRecord("f-1", "alpha", TradeStatus::PENDING, now - 2000)).ok);
        auto cheap = makeRecord("f-2", "beta", TradeStatus::PENDING, now - 1000);
        cheap.quantity = 0.0005;
        cheap.entry_price = 0.5;
        assert(ledger.put(cheap).ok);

        auto hits = ledger.find("alpha", "BTCUSDT", PositionSide::LONG, 1.005, 100.5, {TradeStatus::PENDING});
        assert(hits.size() == 1 && hits[0].trade_id == "f-1");

        assert(ledger.find("alpha", "BTCUSDT", PositionSide::LONG, 1.02, 100.0, {TradeStatus::PENDING}).empty());
        assert(ledger.find("alpha", "BTCUSDT", PositionSide::LONG, 1.0, 102.0, {TradeStatus::PENDING}).empty());
        assert(ledger.find("alpha", "BTCUSDT", PositionSide::SHORT, 1.0, 100.0, {TradeStatus::PENDING}).empty());
        assert(ledger.find("alpha", "ETHUSDT", PositionSide::LONG, 1.0, 100.0, {TradeStatus::PENDING}).empty());
        assert(ledger.find("alpha", "BTCUSDT", PositionSide::LONG, 1.0, 100.0, {TradeStatus::OPEN}).empty());

        // absolute floors apply to tiny values
        hits = ledger.find("beta", "BTCUSDT", PositionSide::LONG, 0.0012, 0.509, {TradeStatus::PENDING});
        assert(hits.size() == 1 && hits[0].trade_id == "f-2");

        // empty strategy matches all, newest first
        hits = ledger.find("", "BTCUSDT", PositionSide::LONG, 1.0, 100.0, {});
        assert(hits.size() == 1);

        assert(ledger.lastActivityMs("BTCUSDT", PositionSide::LONG) == now - 1000);
        assert(ledger.lastActivityMs("BTCUSDT", PositionSide::SHORT) == 0);
    }

    // Corrupt file is quarantined and the ledger starts empty
    {
        const auto dir = freshDir("ledger_corrupt");
        const auto file = dir / "trades.json";
        {
            std::ofstream out(file);
            out << "{ \"trades\": { broken";
        }
        auto storage = std::make_shared<LedgerStorageJson>(file, clock);
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.load();

        assert(ledger.all().empty());
        const auto moved = ledger.lastQuarantinePath();
        assert(!moved.empty());
        assert(std::filesystem::exists(moved));
        assert(!std::filesystem::exists(file));
        assert(moved.find(".corrupt-") != std::string::npos);

        assert(ledger.put(makeRecord("t-3", "alpha", TradeStatus::PENDING, now)).ok);
        assert(std::filesystem::exists(file));
    }

    // Startup stale sweep
    {
        auto storage = std::make_shared<FlakyStorage>();
        auto notifier = std::make_shared<RecordingNotifier>();
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.setNotifier(notifier);
        ledger.load();

        assert(ledger.put(makeRecord("s-old", "alpha", TradeStatus::OPEN, now - 7 * kHour)).ok);
        assert(ledger.put(makeRecord("s-new", "beta", TradeStatus::OPEN, now - 1 * kHour)).ok);
        assert(ledger.put(makeRecord("s-pending", "gamma", TradeStatus::PENDING, now - 8 * kHour)).ok);

        const auto closed = ledger.closeStaleTrades();
        assert(closed.size() == 1);
        const auto old = *ledger.get("s-old");
        assert(old.status == TradeStatus::CLOSED);
        assert(old.exit_reason == "stale-auto-closed");
        assert(old.pnl_absolute && *old.pnl_absolute == 0.0);
        assert(old.exit_time && *old.exit_time == now);
        assert(ledger.get("s-new")->status == TradeStatus::OPEN);
        assert(ledger.get("s-pending")->status == TradeStatus::PENDING);
        assert(notifier->counts[AnomalyType::STALE_CLOSED] == 1);
    }

    // Retention moves expired terminal records to the archive
    {
        const auto dir = freshDir("ledger_retention");
        auto storage = std::make_shared<FlakyStorage>();
        auto archive = std::make_shared<EventJournalJsonl>(dir / "archive.jsonl");
        TradeLedger ledger(storage, fastOptions(), nullptr, archive, clock);
        ledger.load();

        auto expired = makeRecord("r-old", "alpha", TradeStatus::CLOSED, now - 40 * kDay);
        expired.exit_time = now - 31 * kDay;
        auto recent = makeRecord("r-new", "beta", TradeStatus::CLOSED, now - 40 * kDay);
        recent.exit_time = now - 2 * kDay;
        assert(ledger.put(expired).ok);
        assert(ledger.put(recent).ok);
        assert(ledger.put(makeRecord("r-open", "gamma", TradeStatus::OPEN, now - 40 * kDay)).ok);

        assert(ledger.archiveExpired() == 1);
        assert(!ledger.get("r-old").has_value());
        assert(ledger.get("r-new").has_value());
        assert(ledger.get("r-open").has_value());

        const auto rows = archive->readFrom(1);
        assert(rows.size() == 1);
        assert(rows[0].type == JournalEventType::TRADE_ARCHIVED);
        assert(rows[0].entity_id == "r-old");
        assert(tradeFromEvent(rows[0]) == expired);

        const auto stored = storage->load();
        assert(stored && !(*stored)["trades"].contains("r-old"));
    }

    // Exhausted retries fall back to an emergency record
    {
        const auto dir = freshDir("ledger_emergency");
        auto storage = std::make_shared<FlakyStorage>();
        auto emergency = std::make_shared<EventJournalJsonl>(dir / "emergency.jsonl");
        auto notifier = std::make_shared<RecordingNotifier>();
        LedgerOptions options = fastOptions();
        options.verify_retries = 3;
        TradeLedger ledger(storage, options, emergency, nullptr, clock);
        ledger.setNotifier(notifier);
        ledger.load();

        storage->fail_saves = 3;
        const auto record = makeRecord("e-1", "alpha", TradeStatus::PENDING, now);
        const auto result = ledger.put(record);
        assert(!result.ok);
        assert(result.degraded);
        assert(result.kind == ErrorKind::TRANSIENT);

        // memory keeps the full record, storage holds the minimal one
        assert(*ledger.get("e-1") == record);
        const auto stored = (*storage->load())["trades"]["e-1"];
        assert(stored.value("emergency", false));
        assert(stored.value("strategy_name", "") == "alpha");

        const auto rows = emergency->readFrom(1);
        assert(rows.size() == 1);
        assert(rows[0].type == JournalEventType::EMERGENCY_WRITE);
        assert(rows[0].entity_id == "e-1");
        assert(notifier->counts[AnomalyType::WRITE_DEGRADED] == 1);

        // a later healthy write restores the full record
        TradeUpdate open;
        open.status = TradeStatus::OPEN;
        assert(ledger.update("e-1", open).ok);
        const auto restored = tradeRecordFromJson((*storage->load())["trades"]["e-1"]);
        assert(restored.quantity == 1.0);
        assert(!restored.emergency);
    }

    // An emergency record is backfilled once, then its economics are fixed
    {
        auto storage = std::make_shared<FlakyStorage>();
        nlohmann::json document;
        document["trades"]["e-2"] = toMinimalJson(makeRecord("e-2", "beta", TradeStatus::OPEN, now));
        storage->document = document;
        TradeLedger ledger(storage, fastOptions(), nullptr, nullptr, clock);
        ledger.load();

        const auto loaded = *ledger.get("e-2");
        assert(loaded.emergency);
        assert(loaded.quantity == 0.0);

        // still incomplete, so the exemption stays
        TradeUpdate stop;
        stop.stop_loss = 90.0;
        assert(ledger.update("e-2", stop).ok);
        assert(ledger.get("e-2")->emergency);

        TradeUpdate backfill;
        backfill.quantity = 1.0;
        backfill.entry_price = 100.0;
        backfill.margin_used = 20.0;
        backfill.entry_time = now;
        assert(ledger.update("e-2", backfill).ok);
        const auto whole = *ledger.get("e-2");
        assert(!whole.emergency);
        assert(whole.quantity == 1.0 && whole.entry_price == 100.0);
        assert(!tradeRecordFromJson((*storage->load())["trades"]["e-2"]).emergency);

        TradeUpdate resize;
        resize.quantity = 3.0;
        assert(!ledger.update("e-2", resize).ok);
        assert(ledger.get("e-2")->quantity == 1.0);
    }

    // Reload swaps a minimal emergency entry for the journaled full record
    {
        const auto dir = freshDir("ledger_emergency_reload");
        auto storage = std::make_shared<FlakyStorage>();
        auto emergency = std::make_shared<EventJournalJsonl>(dir / "emergency.jsonl");
        LedgerOptions options = fastOptions();
        options.verify_retries = 1;

        auto record = makeRecord("e-3", "gamma", TradeStatus::OPEN, now);
        record.take_profit = 120.0;
        {
            TradeLedger writer(storage, options, emergency, nullptr, clock);
            writer.load();
            storage->fail_saves = 1;
            assert(writer.put(record).degraded);
        }
        assert((*storage->load())["trades"]["e-3"].value("emergency", false));

        // an emergency entry the journal knows nothing about stays flagged
        nlohmann::json document = *storage->load();
        document["trades"]["e-4"] = toMinimalJson(makeRecord("e-4", "delta", TradeStatus::OPEN, now));
        storage->document = document;

        TradeLedger reader(storage, fastOptions(), emergency, nullptr, clock);
        reader.load();
        const auto restored = *reader.get("e-3");
        assert(!restored.emergency);
        assert(restored == record);
        assert(reader.get("e-4")->emergency);

        const auto stored = tradeRecordFromJson((*storage->load())["trades"]["e-3"]);
        assert(!stored.emergency);
        assert(stored.take_profit && *stored.take_profit == 120.0);
    }

    std::cout << "[TEST] TradeLedger PASSED\n";
    return 0;
}
