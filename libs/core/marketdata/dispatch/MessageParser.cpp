#include "MessageParser.hpp"
#include "Channels.hpp"
#include "../errors/MarketDataErrors.hpp"
#include <nlohmann/json.hpp>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

using nlohmann::json;

namespace {

constexpr double kInt64Lo = static_cast<double>(std::numeric_limits<int64_t>::min());   // -2^63, exact

int64_t toInt64(const json& v, const char* key) {
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!std::isfinite(d) || d < kInt64Lo || d >= -kInt64Lo) {
            throw MalformedFrame(std::string("'") + key + "' is out of integer range");
        }
        return static_cast<int64_t>(d);
    }
    if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw MalformedFrame(std::string("'") + key + "' is out of integer range");
    }
    return v.get<int64_t>();
}

// Prices, counts and error codes are stored as int.
int narrow(int64_t v, const char* key) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw MalformedFrame(std::string("'") + key + "' is out of range");
    }
    return static_cast<int>(v);
}

// Integer field that may arrive as a number or a numeric string.
std::optional<int64_t> intField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_number()) return toInt64(*it, key);
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc{} && ptr == s.data() + s.size()) return v;
    }
    return std::nullopt;
}

int64_t requireInt(const json& j, const char* key, std::string_view type) {
    auto v = intField(j, key);
    if (!v) {
        throw MalformedFrame(std::string(type) + " missing integer '" + key + "'");
    }
    return *v;
}

std::optional<uint64_t> seqField(const json& j, const char* key) {
    auto v = intField(j, key);
    if (!v || *v < 0) return std::nullopt;
    return static_cast<uint64_t>(*v);
}

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

const json& requireMsg(const json& frame, std::string_view type) {
    auto it = frame.find("msg");
    if (it == frame.end() || !it->is_object()) {
        throw MalformedFrame(std::string(type) + " without a msg object");
    }
    return *it;
}

std::string requireInstrument(const json& msg, std::string_view type) {
    std::string t = stringField(msg, "market_ticker");
    if (t.empty()) {
        throw MalformedFrame(std::string(type) + " without market_ticker");
    }
    return t;
}

BookSide requireSide(const json& msg, const char* key, std::string_view type) {
    auto side = side_norm::parse(stringField(msg, key));
    if (!side) {
        throw MalformedFrame(std::string(type) + " has invalid '" + key + "'");
    }
    return *side;
}

std::vector<PriceLevel> parseLevels(const json& msg, const char* key) {
    std::vector<PriceLevel> out;
    auto it = msg.find(key);
    if (it == msg.end() || it->is_null()) return out;
    if (!it->is_array()) {
        throw MalformedFrame(std::string("orderbook_snapshot '") + key + "' is not an array");
    }
    out.reserve(it->size());
    for (const auto& lvl : *it) {
        if (!lvl.is_array() || lvl.size() < 2 || !lvl[0].is_number() || !lvl[1].is_number()) {
            throw MalformedFrame(std::string("orderbook_snapshot '") + key + "' level is not [price, qty]");
        }
        out.push_back(PriceLevel{narrow(toInt64(lvl[0], key), key), toInt64(lvl[1], key)});
    }
    return out;
}

} // namespace

namespace MessageParser {

MarketEvent parse(std::string_view raw, std::chrono::system_clock::time_point receivedAt) {
    json frame = json::parse(raw.begin(), raw.end(), nullptr, /*allow_exceptions=*/false);
    if (frame.is_discarded()) {
        throw MalformedFrame("not valid JSON");
    }
    if (!frame.is_object()) {
        throw MalformedFrame("top-level value is not an object");
    }
    auto typeIt = frame.find("type");
    if (typeIt == frame.end() || !typeIt->is_string()) {
        throw MalformedFrame("missing string 'type'");
    }
    const std::string type = typeIt->get<std::string>();

    MarketEvent ev;
    ev.header.receivedAt = receivedAt;
    ev.header.sid = seqField(frame, "sid").value_or(0);
    ev.header.seq = seqField(frame, "seq");
    ev.header.commandId = seqField(frame, "id");
    if (auto msgIt = frame.find("msg"); msgIt != frame.end()) {
        ev.header.payload = msgIt->dump();
    }

    if (type == ch::kTypeTicker || type == ch::kTypeTickerV2) {
        const json& msg = requireMsg(frame, type);
        ev.header.instrument = requireInstrument(msg, type);
        TickerEvent t;
        t.price        = narrow(intField(msg, "price").value_or(0), "price");
        t.yesBid       = narrow(intField(msg, "yes_bid").value_or(0), "yes_bid");
        t.yesAsk       = narrow(intField(msg, "yes_ask").value_or(0), "yes_ask");
        t.volume       = intField(msg, "volume").value_or(0);
        t.openInterest = intField(msg, "open_interest").value_or(0);
        t.exchangeTs   = intField(msg, "ts").value_or(0);
        ev.body = t;
    } else if (type == ch::kTypeSnapshot) {
        const json& msg = requireMsg(frame, type);
        ev.header.instrument = requireInstrument(msg, type);
        BookSnapshotEvent s;
        s.yes = parseLevels(msg, "yes");
        s.no  = parseLevels(msg, "no");
        ev.body = std::move(s);
    } else if (type == ch::kTypeDelta) {
        const json& msg = requireMsg(frame, type);
        ev.header.instrument = requireInstrument(msg, type);
        BookDeltaEvent d;
        d.side  = requireSide(msg, "side", type);
        d.price = narrow(requireInt(msg, "price", type), "price");
        d.delta = requireInt(msg, "delta", type);
        if (auto coid = stringField(msg, "client_order_id"); !coid.empty()) {
            d.clientOrderId = std::move(coid);
        }
        if (auto prev = seqField(msg, "prev_seq")) {
            ev.header.prevSeq = prev;
        } else if (ev.header.seq && *ev.header.seq > 0) {
            ev.header.prevSeq = *ev.header.seq - 1;
        }
        ev.body = std::move(d);
    } else if (type == ch::kTypeTrade) {
        const json& msg = requireMsg(frame, type);
        ev.header.instrument = requireInstrument(msg, type);
        TradeEvent t;
        t.tradeId    = stringField(msg, "trade_id");
        t.yesPrice   = narrow(intField(msg, "yes_price").value_or(0), "yes_price");
        t.noPrice    = narrow(intField(msg, "no_price").value_or(0), "no_price");
        t.count      = requireInt(msg, "count", type);
        t.takerSide  = side_norm::parse(stringField(msg, "taker_side")).value_or(BookSide::Yes);
        t.exchangeTs = intField(msg, "ts").value_or(0);
        ev.body = std::move(t);
    } else if (type == ch::kTypeFill) {
        const json& msg = requireMsg(frame, type);
        ev.header.instrument = requireInstrument(msg, type);
        FillEvent f;
        f.tradeId    = stringField(msg, "trade_id");
        f.orderId    = stringField(msg, "order_id");
        f.side       = requireSide(msg, "side", type);
        f.action     = stringField(msg, "action");
        f.count      = requireInt(msg, "count", type);
        f.yesPrice   = narrow(intField(msg, "yes_price").value_or(0), "yes_price");
        f.noPrice    = narrow(intField(msg, "no_price").value_or(0), "no_price");
        if (auto it = msg.find("is_taker"); it != msg.end() && it->is_boolean()) {
            f.isTaker = it->get<bool>();
        }
        f.exchangeTs = intField(msg, "ts").value_or(0);
        ev.body = std::move(f);
    } else if (type == ch::kTypeError) {
        ProviderErrorEvent e;
        if (auto it = frame.find("msg"); it != frame.end() && it->is_object()) {
            e.code    = narrow(intField(*it, "code").value_or(0), "code");
            e.message = stringField(*it, "msg");
        }
        if (e.message.empty()) e.message = "provider error";
        ev.body = std::move(e);
    } else if (type == ch::kTypeSubscribed || type == ch::kTypeUnsubscribed ||
               type == ch::kTypeOk || type == ch::kTypeAuthenticated) {
        CommandAckEvent a;
        a.ackType = type;
        if (auto it = frame.find("msg"); it != frame.end() && it->is_object()) {
            a.channel = stringField(*it, "channel");
            // "subscribed" carries the new sid inside msg
            if (auto sid = seqField(*it, "sid")) {
                ev.header.sid = *sid;
            }
        }
        ev.body = std::move(a);
    } else {
        UnknownEvent u;
        u.type = type;
        ev.body = std::move(u);
    }

    return ev;
}

} // namespace MessageParser
