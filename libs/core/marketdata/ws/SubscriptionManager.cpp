#include "SubscriptionManager.hpp"
#include "../errors/MarketDataErrors.hpp"
#include <nlohmann/json.hpp>

std::pair<SubscriptionId, bool> SubscriptionManager::add(ChannelKind channel, const std::vector<std::string>& instruments) {
    std::set<std::string> set(instruments.begin(), instruments.end());

    std::lock_guard<std::mutex> lock(m_mx);
    for (const auto& [id, sub] : m_subs) {
        if (sub.channel == channel && sub.instruments == set) {
            return {id, false};
        }
    }
    Subscription sub;
    sub.id = nextIdLocked();
    sub.channel = channel;
    sub.instruments = std::move(set);
    const auto id = sub.id;
    m_subs.emplace(id, std::move(sub));
    return {id, true};
}

std::optional<Subscription> SubscriptionManager::remove(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_subs.find(id);
    if (it == m_subs.end()) {
        return std::nullopt;
    }
    Subscription out = std::move(it->second);
    m_subs.erase(it);
    if (out.inFlight && !out.serverSid) {
        m_orphanCommands.insert(out.wireCommandId);
    }
    return out;
}

std::optional<Subscription> SubscriptionManager::find(SubscriptionId id) const {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_subs.find(id);
    if (it == m_subs.end()) return std::nullopt;
    return it->second;
}

std::vector<Subscription> SubscriptionManager::held() const {
    std::lock_guard<std::mutex> lock(m_mx);
    std::vector<Subscription> out;
    out.reserve(m_subs.size());
    for (const auto& [id, sub] : m_subs) out.push_back(sub);
    return out;
}

std::vector<SubscriptionId> SubscriptionManager::pendingIds() const {
    std::lock_guard<std::mutex> lock(m_mx);
    std::vector<SubscriptionId> out;
    for (const auto& [id, sub] : m_subs) {
        if (sub.pending) out.push_back(id);
    }
    return out;
}

std::vector<SubscriptionId> SubscriptionManager::orderbookSubscriptionsFor(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(m_mx);
    std::vector<SubscriptionId> out;
    for (const auto& [id, sub] : m_subs) {
        if (sub.channel == ChannelKind::OrderbookDelta && sub.instruments.count(instrument)) {
            out.push_back(id);
        }
    }
    return out;
}

std::size_t SubscriptionManager::size() const {
    std::lock_guard<std::mutex> lock(m_mx);
    return m_subs.size();
}

void SubscriptionManager::markAllPending() {
    std::lock_guard<std::mutex> lock(m_mx);
    for (auto& [id, sub] : m_subs) {
        sub.pending = true;
        sub.inFlight = false;
        sub.serverSid.reset();
    }
    m_commandToSub.clear();
    m_orphanCommands.clear();
}

std::optional<uint64_t> SubscriptionManager::beginResubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_subs.find(id);
    if (it == m_subs.end()) return std::nullopt;
    auto sid = it->second.serverSid;
    it->second.serverSid.reset();
    it->second.pending = true;
    it->second.inFlight = false;
    return sid;
}

std::string SubscriptionManager::buildSubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_subs.find(id);
    if (it == m_subs.end()) {
        throw MarketDataError("subscribe for unknown subscription " + std::to_string(id));
    }
    auto& sub = it->second;

    if (sub.wireCommandId != 0) {
        m_commandToSub.erase(sub.wireCommandId);
    }
    sub.wireCommandId = m_preserveIds ? sub.id : nextIdLocked();
    sub.pending = false;
    sub.inFlight = true;
    m_commandToSub[sub.wireCommandId] = sub.id;

    nlohmann::json params;
    params["channels"] = nlohmann::json::array({ch::name(sub.channel)});
    if (!sub.instruments.empty()) {
        params["market_tickers"] = sub.instruments;
    }
    nlohmann::json msg;
    msg["id"] = sub.wireCommandId;
    msg["cmd"] = ch::kCmdSubscribe;
    msg["params"] = std::move(params);
    return msg.dump();
}

std::string SubscriptionManager::buildUnsubscribe(uint64_t sid) {
    std::lock_guard<std::mutex> lock(m_mx);
    nlohmann::json msg;
    msg["id"] = nextIdLocked();
    msg["cmd"] = ch::kCmdUnsubscribe;
    msg["params"] = {{"sids", nlohmann::json::array({sid})}};
    return msg.dump();
}

std::string SubscriptionManager::buildAuthenticate(const SignatureHeaders& headers, uint64_t& commandIdOut) {
    std::lock_guard<std::mutex> lock(m_mx);
    commandIdOut = nextIdLocked();
    nlohmann::json msg;
    msg["id"] = commandIdOut;
    msg["cmd"] = ch::kCmdAuthenticate;
    msg["params"] = {
        {"key", headers.keyId},
        {"signature", headers.signature},
        {"timestamp", headers.timestamp},
    };
    return msg.dump();
}

SubscribeAck SubscriptionManager::onSubscribed(uint64_t commandId, uint64_t sid) {
    std::lock_guard<std::mutex> lock(m_mx);
    SubscribeAck ack;
    if (m_orphanCommands.erase(commandId)) {
        ack.orphanSid = sid;
        return ack;
    }
    auto c = m_commandToSub.find(commandId);
    if (c == m_commandToSub.end()) {
        return ack;
    }
    auto it = m_subs.find(c->second);
    if (it != m_subs.end()) {
        it->second.serverSid = sid;
        it->second.inFlight = false;
        ack.subscription = it->first;
    }
    return ack;
}

std::optional<SubscriptionId> SubscriptionManager::subscriptionForCommand(uint64_t commandId) const {
    std::lock_guard<std::mutex> lock(m_mx);
    auto c = m_commandToSub.find(commandId);
    if (c == m_commandToSub.end()) return std::nullopt;
    return c->second;
}

void SubscriptionManager::onSubscribeRejected(uint64_t commandId) {
    std::lock_guard<std::mutex> lock(m_mx);
    m_orphanCommands.erase(commandId);
    auto c = m_commandToSub.find(commandId);
    if (c == m_commandToSub.end()) return;
    if (auto it = m_subs.find(c->second); it != m_subs.end()) {
        it->second.inFlight = false;
    }
}
