#pragma once
/*
Tapline — IEventStore
Role: Write side of persistence used by the handlers.
Threading: append()/upsertLatest() are called from dispatcher workers and must not block on I/O.
Related: SqliteEventStore.hpp, MarketDataHandlers.hpp, IMarketDataQueries.hpp.
*/
#include <string>
#include "../model/MarketEvents.hpp"
#include "../model/StoredRecord.hpp"
#include "../store/RecordCursor.hpp"

class IEventStore {
public:
    virtual ~IEventStore() = default;

    /// Queue an event for the history table of its kind.
    virtual void append(const MarketEventPtr& event) = 0;

    /// Queue a replacement of the latest ticker / orderbook view of one instrument.
    virtual void upsertLatest(const LatestRecord& record) = 0;

    /// History of one kind for one instrument within a receipt-time range.
    [[nodiscard]] virtual RecordCursor query(const std::string& instrument,
                                             EventKind kind,
                                             const TimeRange& range) const = 0;

    /// Blocks until everything queued so far has been written or dropped.
    virtual void flush() = 0;
};
