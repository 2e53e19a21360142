/*
Tapline — SqliteEventStore
Role: Durable store for received events plus the latest ticker/orderbook view per instrument.
Inputs/Outputs: append()/upsertLatest() enqueue; a writer thread commits batches to SQLite.
                query() and IMarketDataQueries read through a separate connection.
Threading: One writer thread owns the write connection. The queue (mutex + condition variable)
           is the only multi-producer structure. Reads serialize on their own mutex.
Performance: WAL journal, one transaction per batch of up to write_batch_size items.
Observability: Failed batches are retried with doubling backoff, then dropped with a warning;
               writes, retries and drops are counted (and mirrored into StreamMonitor).
Related: SqliteEventStore.cpp, RecordCursor.hpp, IEventStore.hpp, IMarketDataQueries.hpp.
Assumptions: The database file is not shared with another writer process.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include "../sinks/IEventStore.hpp"
#include "../sinks/IMarketDataQueries.hpp"

struct sqlite3;
class StreamMonitor;

struct SqliteStoreOptions {
    std::string               path{"tapline.db"};
    int                       writeRetries{3};
    std::chrono::milliseconds retryBackoff{50};
    std::size_t               batchSize{256};
};

class SqliteEventStore : public IEventStore, public IMarketDataQueries {
public:
    /// Opens (creating if needed) the database and starts the writer. Throws StoreWriteError.
    explicit SqliteEventStore(SqliteStoreOptions options, StreamMonitor* monitor = nullptr);
    ~SqliteEventStore() override;

    SqliteEventStore(const SqliteEventStore&)            = delete;
    SqliteEventStore& operator=(const SqliteEventStore&) = delete;

    // IEventStore
    void append(const MarketEventPtr& event) override;
    void upsertLatest(const LatestRecord& record) override;
    [[nodiscard]] RecordCursor query(const std::string& instrument,
                                     EventKind kind,
                                     const TimeRange& range) const override;
    void flush() override;

    // IMarketDataQueries
    [[nodiscard]] std::optional<StoredRecord> latestTicker(const std::string& instrument) const override;
    [[nodiscard]] std::optional<StoredRecord> latestOrderbook(const std::string& instrument) const override;
    [[nodiscard]] std::vector<StoredRecord> tradeHistory(const std::string& instrument, std::size_t limit) const override;
    [[nodiscard]] std::vector<StoredRecord> fillHistory(const std::string& instrument, std::size_t limit) const override;

    /// Drains the queue and joins the writer. Idempotent; later writes are rejected.
    void stop();

    [[nodiscard]] uint64_t writtenCount() const noexcept { return m_written.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t droppedCount() const noexcept { return m_dropped.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t retryCount() const noexcept   { return m_retries.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t queueDepth() const;

    /// History table holding events of this kind; nullptr for kinds that are not persisted.
    static const char* tableFor(EventKind kind) noexcept;

private:
    struct DbCloser { void operator()(sqlite3* db) const noexcept; };
    using DbPtr = std::unique_ptr<sqlite3, DbCloser>;

    using WorkItem = std::variant<MarketEventPtr, LatestRecord>;

    static DbPtr open(const std::string& path);
    void createSchema();
    void writerLoop();
    void writeBatch(const std::vector<WorkItem>& batch);
    void enqueue(WorkItem item);

    std::vector<StoredRecord> recent(const char* table, EventKind kind,
                                     const std::string& instrument, std::size_t limit) const;
    std::optional<StoredRecord> latest(const char* table, EventKind kind, const std::string& instrument) const;

    const SqliteStoreOptions m_options;
    StreamMonitor*           m_monitor;

    DbPtr              m_writeDb;
    DbPtr              m_readDb;
    mutable std::mutex m_readMx;

    mutable std::mutex      m_queueMx;
    std::condition_variable m_queueCv;
    std::condition_variable m_flushCv;
    std::deque<WorkItem>    m_queue;
    uint64_t                m_enqueued{0};   // guarded by m_queueMx
    uint64_t                m_completed{0};  // guarded by m_queueMx
    bool                    m_stopping{false};
    std::thread             m_writer;

    std::atomic<uint64_t> m_written{0};
    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_retries{0};
};
