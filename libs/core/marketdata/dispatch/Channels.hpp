#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "../model/MarketEvents.hpp"

// Channels a client can subscribe to.
enum class ChannelKind {
    Ticker,
    OrderbookDelta,
    Trade,
    Fill
};

namespace ch {
    // Subscription channel names
    inline constexpr const char* kTicker         = "ticker";
    inline constexpr const char* kOrderbookDelta = "orderbook_delta";
    inline constexpr const char* kTrade          = "trade";
    inline constexpr const char* kFill           = "fill";

    // Push message "type" discriminators
    inline constexpr const char* kTypeTicker        = "ticker";
    inline constexpr const char* kTypeTickerV2      = "ticker_v2";
    inline constexpr const char* kTypeSnapshot      = "orderbook_snapshot";
    inline constexpr const char* kTypeDelta         = "orderbook_delta";
    inline constexpr const char* kTypeTrade         = "trade";
    inline constexpr const char* kTypeFill          = "fill";
    inline constexpr const char* kTypeError         = "error";
    inline constexpr const char* kTypeSubscribed    = "subscribed";
    inline constexpr const char* kTypeUnsubscribed  = "unsubscribed";
    inline constexpr const char* kTypeOk            = "ok";
    inline constexpr const char* kTypeAuthenticated = "authenticated";

    // Commands
    inline constexpr const char* kCmdSubscribe    = "subscribe";
    inline constexpr const char* kCmdUnsubscribe  = "unsubscribe";
    inline constexpr const char* kCmdAuthenticate = "authenticate";

    inline const char* name(ChannelKind kind) {
        switch (kind) {
            case ChannelKind::Ticker:         return kTicker;
            case ChannelKind::OrderbookDelta: return kOrderbookDelta;
            case ChannelKind::Trade:          return kTrade;
            case ChannelKind::Fill:           return kFill;
        }
        return kTicker;
    }

    inline std::optional<ChannelKind> parse(std::string_view s) {
        if (s == kTicker)         return ChannelKind::Ticker;
        if (s == kOrderbookDelta) return ChannelKind::OrderbookDelta;
        if (s == kTrade)          return ChannelKind::Trade;
        if (s == kFill)           return ChannelKind::Fill;
        return std::nullopt;
    }
}

namespace side_norm {
    inline std::optional<BookSide> parse(std::string_view s) {
        if (s == "yes" || s == "YES") return BookSide::Yes;
        if (s == "no"  || s == "NO")  return BookSide::No;
        return std::nullopt;
    }

    inline const char* toString(BookSide side) {
        return side == BookSide::Yes ? "yes" : "no";
    }
}
