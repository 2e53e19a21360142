#ifndef TAPLINE_MARKETEVENTS_H
#define TAPLINE_MARKETEVENTS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Closed set of push-message kinds. Order matches EventBody alternatives.
enum class EventKind {
    Ticker,
    OrderbookSnapshot,
    OrderbookDelta,
    Trade,
    Fill,
    Error,
    Ack,
    Unknown
};

inline constexpr std::size_t kEventKindCount = 8;

inline const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::Ticker:            return "ticker";
        case EventKind::OrderbookSnapshot: return "orderbook_snapshot";
        case EventKind::OrderbookDelta:    return "orderbook_delta";
        case EventKind::Trade:             return "trade";
        case EventKind::Fill:              return "fill";
        case EventKind::Error:             return "error";
        case EventKind::Ack:               return "ack";
        case EventKind::Unknown:           return "unknown";
    }
    return "unknown";
}

// Binary contract sides. Prices are in cents (1..99).
enum class BookSide {
    Yes,
    No
};

// Fields common to every event.
struct EventHeader {
    std::string instrument;                     // market ticker, empty for acks/errors
    uint64_t sid{0};                            // server subscription id, 0 if absent
    std::optional<uint64_t> seq;                // per-sid sequence number
    std::optional<uint64_t> prevSeq;            // expected prior sequence (deltas)
    std::optional<uint64_t> commandId;          // client command id echoed by acks/errors
    std::chrono::system_clock::time_point receivedAt;
    std::string payload;                        // venue "msg" object, serialized JSON
};

struct TickerEvent {
    int     price{0};
    int     yesBid{0};
    int     yesAsk{0};
    int64_t volume{0};
    int64_t openInterest{0};
    int64_t exchangeTs{0};                      // seconds since epoch, 0 if absent
};

struct PriceLevel {
    int     price{0};
    int64_t quantity{0};

    bool operator==(const PriceLevel&) const = default;
};

struct BookSnapshotEvent {
    std::vector<PriceLevel> yes;
    std::vector<PriceLevel> no;
};

struct BookDeltaEvent {
    BookSide side{BookSide::Yes};
    int      price{0};
    int64_t  delta{0};                          // positive adds, negative removes
    std::optional<std::string> clientOrderId;   // present when our own order caused it
};

struct TradeEvent {
    std::string tradeId;
    int         yesPrice{0};
    int         noPrice{0};
    int64_t     count{0};
    BookSide    takerSide{BookSide::Yes};
    int64_t     exchangeTs{0};
};

struct FillEvent {
    std::string tradeId;
    std::string orderId;
    BookSide    side{BookSide::Yes};
    std::string action;                         // "buy" | "sell"
    int64_t     count{0};
    int         yesPrice{0};
    int         noPrice{0};
    bool        isTaker{false};
    int64_t     exchangeTs{0};
};

struct ProviderErrorEvent {
    int         code{0};
    std::string message;
};

struct CommandAckEvent {
    std::string ackType;                        // subscribed | unsubscribed | ok | authenticated
    std::string channel;
};

// Forward compatibility: a well-formed message with a type we do not model.
struct UnknownEvent {
    std::string type;
};

using EventBody = std::variant<TickerEvent,
                               BookSnapshotEvent,
                               BookDeltaEvent,
                               TradeEvent,
                               FillEvent,
                               ProviderErrorEvent,
                               CommandAckEvent,
                               UnknownEvent>;

static_assert(std::variant_size_v<EventBody> == kEventKindCount);

struct MarketEvent {
    EventHeader header;
    EventBody   body;

    [[nodiscard]] EventKind kind() const noexcept {
        return static_cast<EventKind>(body.index());
    }
};

using MarketEventPtr = std::shared_ptr<const MarketEvent>;

#endif // TAPLINE_MARKETEVENTS_H
