#include "SqliteEventStore.hpp"
#include "../errors/MarketDataErrors.hpp"
#include "StreamMonitor.hpp"
#include "TaplineLogging.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <format>
#include <limits>

namespace {

struct StmtFinalizer {
    void operator()(sqlite3_stmt* s) const noexcept { sqlite3_finalize(s); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

std::string lastError(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "no database handle";
}

template <typename Error>
StmtPtr prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
        throw Error("prepare failed (" + lastError(db) + "): " + sql);
    }
    return StmtPtr(raw);
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : lastError(db);
        sqlite3_free(err);
        throw StoreWriteError(std::string(sql) + ": " + msg);
    }
}

void bindText(sqlite3_stmt* s, int idx, const std::string& v) {
    sqlite3_bind_text(s, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void bindOptional(sqlite3_stmt* s, int idx, const std::optional<uint64_t>& v) {
    if (v) sqlite3_bind_int64(s, idx, static_cast<sqlite3_int64>(*v));
    else   sqlite3_bind_null(s, idx);
}

std::string columnText(sqlite3_stmt* s, int col) {
    const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(s, col));
    return p ? std::string(p, static_cast<std::size_t>(sqlite3_column_bytes(s, col))) : std::string{};
}

std::optional<uint64_t> columnOptional(sqlite3_stmt* s, int col) {
    if (sqlite3_column_type(s, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<uint64_t>(sqlite3_column_int64(s, col));
}

// Columns: id, instrument, sid, seq, received_at_us, payload
StoredRecord readHistoryRow(sqlite3_stmt* s, EventKind kind) {
    StoredRecord r;
    r.id           = sqlite3_column_int64(s, 0);
    r.kind         = kind;
    r.instrument   = columnText(s, 1);
    r.sid          = static_cast<uint64_t>(sqlite3_column_int64(s, 2));
    r.seq          = columnOptional(s, 3);
    r.receivedAtUs = sqlite3_column_int64(s, 4);
    r.payload      = columnText(s, 5);
    return r;
}

constexpr const char* kHistoryTables[] = {
    "ticker_history", "orderbook_snapshots", "orderbook_deltas", "trades", "fills"
};

// Keyset pager over one history table; owns its own read-only connection.
class SqlitePager : public IRecordPager {
public:
    SqlitePager(std::string path, const char* table, EventKind kind, std::string instrument, TimeRange range)
        : m_path(std::move(path))
        , m_table(table)
        , m_kind(kind)
        , m_instrument(std::move(instrument))
        , m_fromUs(toMicros(range.from))
        , m_toUs(toMicros(range.to))
    {}

    ~SqlitePager() override {
        if (m_db) sqlite3_close_v2(m_db);
    }

    std::vector<StoredRecord> fetchPage(const std::optional<RecordKey>& after, std::size_t limit) override {
        ensureOpen();
        auto stmt = prepare<MarketDataError>(m_db, std::format(
            "SELECT id, instrument, sid, seq, received_at_us, payload FROM {} "
            "WHERE instrument = ?1 AND received_at_us >= ?2 AND received_at_us < ?3 "
            "AND (received_at_us > ?4 OR (received_at_us = ?4 AND id > ?5)) "
            "ORDER BY received_at_us, id LIMIT ?6", m_table));

        const auto minKey = std::numeric_limits<sqlite3_int64>::min();
        bindText(stmt.get(), 1, m_instrument);
        sqlite3_bind_int64(stmt.get(), 2, m_fromUs);
        sqlite3_bind_int64(stmt.get(), 3, m_toUs);
        sqlite3_bind_int64(stmt.get(), 4, after ? after->receivedAtUs : minKey);
        sqlite3_bind_int64(stmt.get(), 5, after ? after->id : minKey);
        sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(limit));

        std::vector<StoredRecord> out;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            out.push_back(readHistoryRow(stmt.get(), m_kind));
        }
        if (rc != SQLITE_DONE) {
            throw MarketDataError("store read failed: " + lastError(m_db));
        }
        return out;
    }

private:
    void ensureOpen() {
        if (m_db) return;
        if (sqlite3_open_v2(m_path.c_str(), &m_db, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
            std::string msg = lastError(m_db);
            sqlite3_close_v2(m_db);
            m_db = nullptr;
            throw MarketDataError("store read open failed: " + msg);
        }
        sqlite3_busy_timeout(m_db, 2000);
    }

    std::string m_path;
    const char* m_table;
    EventKind   m_kind;
    std::string m_instrument;
    int64_t     m_fromUs;
    int64_t     m_toUs;
    sqlite3*    m_db{nullptr};
};

} // namespace

void SqliteEventStore::DbCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

const char* SqliteEventStore::tableFor(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Ticker:            return "ticker_history";
        case EventKind::OrderbookSnapshot: return "orderbook_snapshots";
        case EventKind::OrderbookDelta:    return "orderbook_deltas";
        case EventKind::Trade:             return "trades";
        case EventKind::Fill:              return "fills";
        default:                           return nullptr;
    }
}

SqliteEventStore::DbPtr SqliteEventStore::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    DbPtr db(raw);
    if (rc != SQLITE_OK) {
        throw StoreWriteError("failed to open " + path + ": " + lastError(raw));
    }
    sqlite3_busy_timeout(raw, 2000);
    return db;
}

SqliteEventStore::SqliteEventStore(SqliteStoreOptions options, StreamMonitor* monitor)
    : m_options(std::move(options))
    , m_monitor(monitor)
{
    m_writeDb = open(m_options.path);
    createSchema();
    m_readDb = open(m_options.path);

    m_writer = std::thread([this] { writerLoop(); });
    tLog_App(QString("💾 Event store open at %1").arg(QString::fromStdString(m_options.path)));
}

SqliteEventStore::~SqliteEventStore() {
    stop();
}

void SqliteEventStore::createSchema() {
    sqlite3* db = m_writeDb.get();
    exec(db, "PRAGMA journal_mode=WAL");
    exec(db, "PRAGMA synchronous=NORMAL");

    for (const char* table : kHistoryTables) {
        const auto ddl = std::format(
            "CREATE TABLE IF NOT EXISTS {0} ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "instrument TEXT NOT NULL, "
            "sid INTEGER NOT NULL DEFAULT 0, "
            "seq INTEGER, "
            "received_at_us INTEGER NOT NULL, "
            "payload TEXT NOT NULL)", table);
        exec(db, ddl.c_str());
        const auto idx = std::format(
            "CREATE INDEX IF NOT EXISTS idx_{0}_instrument_time ON {0} (instrument, received_at_us)", table);
        exec(db, idx.c_str());
    }
    for (const char* table : {"latest_ticker", "latest_orderbook"}) {
        const auto ddl = std::format(
            "CREATE TABLE IF NOT EXISTS {} ("
            "instrument TEXT PRIMARY KEY, "
            "seq INTEGER, "
            "received_at_us INTEGER NOT NULL, "
            "payload TEXT NOT NULL, "
            "stale INTEGER NOT NULL DEFAULT 0)", table);
        exec(db, ddl.c_str());
    }
}

void SqliteEventStore::append(const MarketEventPtr& event) {
    if (!event || tableFor(event->kind()) == nullptr) {
        return;
    }
    enqueue(event);
}

void SqliteEventStore::upsertLatest(const LatestRecord& record) {
    enqueue(record);
}

void SqliteEventStore::enqueue(WorkItem item) {
    {
        std::lock_guard<std::mutex> lock(m_queueMx);
        if (!m_stopping) {
            m_queue.push_back(std::move(item));
            ++m_enqueued;
            m_queueCv.notify_one();
            return;
        }
    }
    m_dropped.fetch_add(1, std::memory_order_relaxed);
    if (m_monitor) m_monitor->recordStoreDrops(1);
    tLog_StoreN(100, "⚠️ Store stopped; write rejected");
}

void SqliteEventStore::flush() {
    std::unique_lock<std::mutex> lock(m_queueMx);
    const uint64_t target = m_enqueued;
    m_flushCv.wait(lock, [&] { return m_completed >= target; });
}

void SqliteEventStore::stop() {
    {
        std::lock_guard<std::mutex> lock(m_queueMx);
        m_stopping = true;
    }
    m_queueCv.notify_all();
    if (m_writer.joinable()) {
        m_writer.join();
        tLog_App(QString("💾 Event store closed (written=%1 dropped=%2)")
                     .arg(writtenCount()).arg(droppedCount()));
    }
}

std::size_t SqliteEventStore::queueDepth() const {
    std::lock_guard<std::mutex> lock(m_queueMx);
    return m_queue.size();
}

void SqliteEventStore::writerLoop() {
    for (;;) {
        std::vector<WorkItem> batch;
        {
            std::unique_lock<std::mutex> lock(m_queueMx);
            m_queueCv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;
            }
            const std::size_t n = std::min(m_queue.size(), m_options.batchSize);
            batch.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                batch.push_back(std::move(m_queue.front()));
                m_queue.pop_front();
            }
        }

        auto backoff = m_options.retryBackoff;
        for (int attempt = 0;; ++attempt) {
            try {
                writeBatch(batch);
                m_written.fetch_add(batch.size(), std::memory_order_relaxed);
                if (m_monitor) m_monitor->recordStoreWrites(batch.size());
                tLog_Store(QString("💾 Committed batch of %1").arg(batch.size()));
                break;
            } catch (const StoreWriteError& e) {
                if (attempt >= m_options.writeRetries) {
                    m_dropped.fetch_add(batch.size(), std::memory_order_relaxed);
                    if (m_monitor) m_monitor->recordStoreDrops(batch.size());
                    tLog_Warning(QString("❌ Dropping batch of %1 after %2 retries: %3")
                                     .arg(batch.size()).arg(attempt).arg(QString::fromUtf8(e.what())));
                    break;
                }
                m_retries.fetch_add(1, std::memory_order_relaxed);
                if (m_monitor) m_monitor->recordStoreRetry();
                tLog_StoreN(1, "⚠️ Batch write failed, retrying:" << e.what());
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMx);
            m_completed += batch.size();
        }
        m_flushCv.notify_all();
    }
}

void SqliteEventStore::writeBatch(const std::vector<WorkItem>& batch) {
    sqlite3* db = m_writeDb.get();
    exec(db, "BEGIN IMMEDIATE");
    try {
        for (const auto& item : batch) {
            if (const auto* ev = std::get_if<MarketEventPtr>(&item)) {
                const auto& e = **ev;
                auto stmt = prepare<StoreWriteError>(db, std::format(
                    "INSERT INTO {} (instrument, sid, seq, received_at_us, payload) VALUES (?1, ?2, ?3, ?4, ?5)",
                    tableFor(e.kind())));
                bindText(stmt.get(), 1, e.header.instrument);
                sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(e.header.sid));
                bindOptional(stmt.get(), 3, e.header.seq);
                sqlite3_bind_int64(stmt.get(), 4, toMicros(e.header.receivedAt));
                bindText(stmt.get(), 5, e.header.payload);
                if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                    throw StoreWriteError("insert failed: " + lastError(db));
                }
            } else {
                const auto& r = std::get<LatestRecord>(item);
                const char* table = r.view == LatestRecord::View::Ticker ? "latest_ticker" : "latest_orderbook";
                if (r.stale) {
                    auto stmt = prepare<StoreWriteError>(db, std::format(
                        "UPDATE {} SET stale = 1 WHERE instrument = ?1", table));
                    bindText(stmt.get(), 1, r.instrument);
                    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                        throw StoreWriteError("stale mark failed: " + lastError(db));
                    }
                    continue;
                }
                auto stmt = prepare<StoreWriteError>(db, std::format(
                    "INSERT INTO {} (instrument, seq, received_at_us, payload, stale) VALUES (?1, ?2, ?3, ?4, 0) "
                    "ON CONFLICT(instrument) DO UPDATE SET seq = excluded.seq, "
                    "received_at_us = excluded.received_at_us, payload = excluded.payload, stale = 0", table));
                bindText(stmt.get(), 1, r.instrument);
                bindOptional(stmt.get(), 2, r.seq);
                sqlite3_bind_int64(stmt.get(), 3, r.receivedAtUs);
                bindText(stmt.get(), 4, r.payload);
                if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                    throw StoreWriteError("upsert failed: " + lastError(db));
                }
            }
        }
        exec(db, "COMMIT");
    } catch (const StoreWriteError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

RecordCursor SqliteEventStore::query(const std::string& instrument, EventKind kind, const TimeRange& range) const {
    const char* table = tableFor(kind);
    if (!table) {
        return RecordCursor(nullptr);
    }
    return RecordCursor(std::make_shared<SqlitePager>(m_options.path, table, kind, instrument, range));
}

std::optional<StoredRecord> SqliteEventStore::latest(const char* table, EventKind kind, const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(m_readMx);
    sqlite3* db = m_readDb.get();
    auto stmt = prepare<MarketDataError>(db, std::format(
        "SELECT instrument, seq, received_at_us, payload FROM {} WHERE instrument = ?1 AND stale = 0", table));
    bindText(stmt.get(), 1, instrument);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw MarketDataError("store read failed: " + lastError(db));
    }
    StoredRecord r;
    r.kind         = kind;
    r.instrument   = columnText(stmt.get(), 0);
    r.seq          = columnOptional(stmt.get(), 1);
    r.receivedAtUs = sqlite3_column_int64(stmt.get(), 2);
    r.payload      = columnText(stmt.get(), 3);
    return r;
}

std::vector<StoredRecord> SqliteEventStore::recent(const char* table, EventKind kind,
                                                   const std::string& instrument, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(m_readMx);
    sqlite3* db = m_readDb.get();
    auto stmt = prepare<MarketDataError>(db, std::format(
        "SELECT id, instrument, sid, seq, received_at_us, payload FROM {} WHERE instrument = ?1 "
        "ORDER BY received_at_us DESC, id DESC LIMIT ?2", table));
    bindText(stmt.get(), 1, instrument);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));

    std::vector<StoredRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(readHistoryRow(stmt.get(), kind));
    }
    if (rc != SQLITE_DONE) {
        throw MarketDataError("store read failed: " + lastError(db));
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<StoredRecord> SqliteEventStore::latestTicker(const std::string& instrument) const {
    return latest("latest_ticker", EventKind::Ticker, instrument);
}

std::optional<StoredRecord> SqliteEventStore::latestOrderbook(const std::string& instrument) const {
    return latest("latest_orderbook", EventKind::OrderbookSnapshot, instrument);
}

std::vector<StoredRecord> SqliteEventStore::tradeHistory(const std::string& instrument, std::size_t limit) const {
    return recent("trades", EventKind::Trade, instrument, limit);
}

std::vector<StoredRecord> SqliteEventStore::fillHistory(const std::string& instrument, std::size_t limit) const {
    return recent("fills", EventKind::Fill, instrument, limit);
}
