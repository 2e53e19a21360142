#pragma once
/*
Tapline — IMarketDataQueries
Role: Read surface for downstream consumers (decision engine, position tracker).
Threading: Safe from any thread; implementations read through a dedicated connection.
*/
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../model/StoredRecord.hpp"

class IMarketDataQueries {
public:
    virtual ~IMarketDataQueries() = default;

    [[nodiscard]] virtual std::optional<StoredRecord> latestTicker(const std::string& instrument) const = 0;
    /// Empty while the book is stale (sequence gap or lost connection) until a fresh snapshot lands.
    [[nodiscard]] virtual std::optional<StoredRecord> latestOrderbook(const std::string& instrument) const = 0;

    // Newest `limit` rows, returned oldest first.
    [[nodiscard]] virtual std::vector<StoredRecord> tradeHistory(const std::string& instrument, std::size_t limit) const = 0;
    [[nodiscard]] virtual std::vector<StoredRecord> fillHistory(const std::string& instrument, std::size_t limit) const = 0;
};
