#pragma once
#include "marketdata/sinks/IEventStore.hpp"
#include "marketdata/store/RecordCursor.hpp"
#include <algorithm>
#include <mutex>
#include <vector>

/// Pager over an in-memory vector, already sorted by (receivedAtUs, id).
class VectorPager : public IRecordPager {
public:
    explicit VectorPager(std::vector<StoredRecord> rows) : rows_(std::move(rows)) {}

    std::vector<StoredRecord> fetchPage(const std::optional<RecordKey>& after, std::size_t limit) override {
        ++pagesFetched;
        std::vector<StoredRecord> out;
        for (const auto& r : rows_) {
            if (after && (r.receivedAtUs < after->receivedAtUs ||
                          (r.receivedAtUs == after->receivedAtUs && r.id <= after->id))) {
                continue;
            }
            out.push_back(r);
            if (out.size() == limit) break;
        }
        return out;
    }

    void append(StoredRecord r) { rows_.push_back(std::move(r)); }

    int pagesFetched{0};

private:
    std::vector<StoredRecord> rows_;
};

/// Spy store that records every write for assertions
class SpyStore : public IEventStore {
public:
    void append(const MarketEventPtr& event) override {
        std::lock_guard<std::mutex> lock(mx_);
        events_.push_back(event);
    }

    void upsertLatest(const LatestRecord& record) override {
        std::lock_guard<std::mutex> lock(mx_);
        latest_.push_back(record);
    }

    RecordCursor query(const std::string& instrument, EventKind kind, const TimeRange& range) const override {
        std::lock_guard<std::mutex> lock(mx_);
        std::vector<StoredRecord> rows;
        int64_t id = 0;
        for (const auto& e : events_) {
            ++id;
            const auto us = toMicros(e->header.receivedAt);
            if (e->kind() != kind || e->header.instrument != instrument) continue;
            if (us < toMicros(range.from) || us >= toMicros(range.to)) continue;
            rows.push_back(StoredRecord{id, kind, instrument, e->header.sid, e->header.seq, us, e->header.payload});
        }
        std::stable_sort(rows.begin(), rows.end(), [](const StoredRecord& a, const StoredRecord& b) {
            return a.receivedAtUs < b.receivedAtUs;
        });
        return RecordCursor(std::make_shared<VectorPager>(std::move(rows)));
    }

    void flush() override {}

    // Test helpers
    std::vector<MarketEventPtr> events() const {
        std::lock_guard<std::mutex> lock(mx_);
        return events_;
    }

    std::vector<LatestRecord> latest() const {
        std::lock_guard<std::mutex> lock(mx_);
        return latest_;
    }

    std::size_t countOf(EventKind kind) const {
        std::lock_guard<std::mutex> lock(mx_);
        return std::count_if(events_.begin(), events_.end(),
                             [kind](const MarketEventPtr& e) { return e->kind() == kind; });
    }

    std::size_t latestCountOf(LatestRecord::View view) const {
        std::lock_guard<std::mutex> lock(mx_);
        return std::count_if(latest_.begin(), latest_.end(),
                             [view](const LatestRecord& r) { return r.view == view; });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mx_);
        events_.clear();
        latest_.clear();
    }

private:
    mutable std::mutex          mx_;
    std::vector<MarketEventPtr> events_;
    std::vector<LatestRecord>   latest_;
};
