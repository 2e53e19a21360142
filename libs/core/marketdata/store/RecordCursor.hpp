#pragma once
/*
Tapline — RecordCursor
Role: Lazy, finite, restartable iteration over stored records in (receipt time, row id) order.
Inputs/Outputs: Pulls pages from an IRecordPager using keyset pagination; hands out one record per next().
Threading: A cursor is used by one thread at a time; pagers must tolerate concurrent writers.
Performance: Holds at most one page in memory.
Related: SqliteEventStore.cpp (SqlitePager), tests/marketdata/fixtures/spy_store.hpp (VectorPager).
*/
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>
#include "../model/StoredRecord.hpp"

// Keyset position: last (receivedAtUs, id) handed out.
struct RecordKey {
    int64_t receivedAtUs{0};
    int64_t id{0};
};

class IRecordPager {
public:
    virtual ~IRecordPager() = default;

    /// Up to `limit` records strictly after `after` (or from the start), in key order.
    [[nodiscard]] virtual std::vector<StoredRecord> fetchPage(const std::optional<RecordKey>& after,
                                                              std::size_t limit) = 0;
};

class RecordCursor {
public:
    static constexpr std::size_t kDefaultPageSize = 500;

    explicit RecordCursor(std::shared_ptr<IRecordPager> pager, std::size_t pageSize = kDefaultPageSize);

    /// Next record, or nullopt once the sequence is exhausted. Throws StoreWriteError on read failure.
    [[nodiscard]] std::optional<StoredRecord> next();

    /// Restart from the beginning; rows written since are included in the new pass.
    void rewind();

    /// Drains the remainder into a vector.
    [[nodiscard]] std::vector<StoredRecord> collect();

private:
    std::shared_ptr<IRecordPager> m_pager;
    std::size_t                   m_pageSize;
    std::deque<StoredRecord>      m_page;
    std::optional<RecordKey>      m_last;
    bool                          m_exhausted{false};
};
