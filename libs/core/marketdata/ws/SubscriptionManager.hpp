#pragma once
/*
Tapline — SubscriptionManager
Role: The held-subscription set plus the venue bookkeeping needed to (re)send it.
Inputs/Outputs: add()/remove() from the session; build*() produce wire commands; ack hooks map
                client command ids to server sids.
Threading: Internally locked; safe from any thread. SessionManager calls the build/ack methods
           from its strand only.
Invariant: Equivalent (channel, instrument set) requests share one subscription. Ids and command
           ids come from one counter, so a preserved subscription id never collides with a
           command id.
*/
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "../auth/ISigner.hpp"
#include "../dispatch/Channels.hpp"

using SubscriptionId = uint64_t;

struct Subscription {
    SubscriptionId          id{0};
    ChannelKind             channel{ChannelKind::Ticker};
    std::set<std::string>   instruments;
    uint64_t                wireCommandId{0};   // id of the last subscribe command sent
    std::optional<uint64_t> serverSid;          // known once acked on the current connection
    bool                    pending{true};      // must be (re)sent on the next Ready
    bool                    inFlight{false};    // sent, ack not yet seen
};

struct SubscribeAck {
    std::optional<SubscriptionId> subscription;     // held subscription the ack belongs to
    std::optional<uint64_t>       orphanSid;        // sid of a subscription removed before its ack
};

class SubscriptionManager {
public:
    explicit SubscriptionManager(bool preserveIds = false) : m_preserveIds(preserveIds) {}

    /// Returns the id and whether a new subscription was created.
    std::pair<SubscriptionId, bool> add(ChannelKind channel, const std::vector<std::string>& instruments);

    /// Removes from the held set. An unacked subscription leaves an orphan command behind so the
    /// eventual ack can be answered with an unsubscribe.
    std::optional<Subscription> remove(SubscriptionId id);

    [[nodiscard]] std::optional<Subscription> find(SubscriptionId id) const;
    [[nodiscard]] std::vector<Subscription>   held() const;
    [[nodiscard]] std::vector<SubscriptionId> pendingIds() const;
    [[nodiscard]] std::vector<SubscriptionId> orderbookSubscriptionsFor(const std::string& instrument) const;
    [[nodiscard]] std::size_t size() const;

    /// New connection: nothing is on the wire anymore.
    void markAllPending();

    /// Resync: forget the sid and queue for resend; returns the sid to unsubscribe, if known.
    std::optional<uint64_t> beginResubscribe(SubscriptionId id);

    // Wire commands
    std::string buildSubscribe(SubscriptionId id);
    std::string buildUnsubscribe(uint64_t sid);
    std::string buildAuthenticate(const SignatureHeaders& headers, uint64_t& commandIdOut);

    // Acks
    SubscribeAck onSubscribed(uint64_t commandId, uint64_t sid);
    [[nodiscard]] std::optional<SubscriptionId> subscriptionForCommand(uint64_t commandId) const;
    void onSubscribeRejected(uint64_t commandId);

    [[nodiscard]] bool preserveIds() const noexcept { return m_preserveIds; }

private:
    uint64_t nextIdLocked() { return m_next++; }

    const bool m_preserveIds;

    mutable std::mutex                                  m_mx;
    uint64_t                                            m_next{1};
    std::map<SubscriptionId, Subscription>              m_subs;
    std::unordered_map<uint64_t, SubscriptionId>        m_commandToSub;
    std::unordered_set<uint64_t>                        m_orphanCommands;
};
