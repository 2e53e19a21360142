#include "SessionManager.hpp"
#include "../dispatch/MessageDispatcher.hpp"
#include "../errors/MarketDataErrors.hpp"
#include "StreamMonitor.hpp"
#include "TaplineLogging.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <format>
#include <random>

namespace net = boost::asio;

namespace {
RequestDescriptor upgradeRequest(const WsEndpoint& ep) {
    return RequestDescriptor{"GET", ep.target};
}
}

SessionOptions SessionOptions::fromConfig(const StreamConfig& config) {
    SessionOptions o;
    o.authMode = config.authMode;
    o.endpoint = WsEndpoint::parse(config.endpoint());
    o.authTimeout = config.authTimeout;
    o.backoffBase = config.backoffBase;
    o.backoffMax = config.backoffMax;
    o.backoffJitter = config.backoffJitter;
    o.preserveSubscriptionIds = config.preserveSubscriptionIds;
    return o;
}

SessionManager::SessionManager(net::io_context& ioc,
                               WsTransport& transport,
                               MessageDispatcher& dispatcher,
                               std::shared_ptr<const ISigner> signer,
                               SessionOptions options,
                               StreamMonitor* monitor)
    : m_strand(net::make_strand(ioc))
    , m_timer(m_strand)
    , m_transport(transport)
    , m_dispatcher(dispatcher)
    , m_signer(std::move(signer))
    , m_options(std::move(options))
    , m_monitor(monitor)
    , m_backoff(m_options.backoffBase, m_options.backoffMax, m_options.backoffJitter,
                m_options.backoffSeed ? *m_options.backoffSeed : std::random_device{}())
    , m_subs(m_options.preserveSubscriptionIds)
{
    // Receive loop feeds the dispatcher directly; it is the only caller of onFrame().
    m_transport.onMessage([this](std::string raw) {
        // Frames still in flight after a drop or stop belong to a connection we have given up on.
        if (m_stopping || !acceptsFrames(state())) return;
        m_dispatcher.onFrame(raw);
    });
    m_transport.onSecured([this]() { net::post(m_strand, [this] { handleSecured(); }); });
    m_transport.onOpen([this]() { net::post(m_strand, [this] { handleOpen(); }); });
    m_transport.onFault([this](TransportFault f) {
        net::post(m_strand, [this, f = std::move(f)] { handleFault(f); });
    });

    m_dispatcher.setControlListener([this](const MarketEventPtr& ev) {
        net::post(m_strand, [this, ev] { handleControl(ev); });
    });
    m_dispatcher.setBreakerListener([this](const std::string& reason) { forceDegraded(reason); });
}

bool SessionManager::acceptsFrames(ConnectionState s) noexcept {
    return s == ConnectionState::Connecting || s == ConnectionState::Authenticating || s == ConnectionState::Ready;
}

SessionManager::~SessionManager() {
    // The io_context is stopped before destruction; detach so nothing calls back into us.
    m_transport.onMessage(nullptr);
    m_transport.onSecured(nullptr);
    m_transport.onOpen(nullptr);
    m_transport.onFault(nullptr);
    m_dispatcher.setControlListener(nullptr);
    m_dispatcher.setBreakerListener(nullptr);
}

// ─────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────

void SessionManager::start(std::shared_ptr<const ISigner> freshSigner) {
    net::post(m_strand, [this, fresh = std::move(freshSigner)]() mutable {
        const auto s = state();
        if (s != ConnectionState::Idle && s != ConnectionState::Closed && s != ConnectionState::Failed) {
            tLog_App(QString("start() ignored in state %1").arg(toString(s)));
            return;
        }
        if (fresh) {
            m_signer = std::move(fresh);
        }
        m_stopping = false;
        m_backoff.reset();
        beginConnect();
    });
}

void SessionManager::stop() {
    m_stopping = true;
    net::post(m_strand, [this] { doStop(); });
}

SubscriptionId SessionManager::subscribe(ChannelKind channel, const std::vector<std::string>& instruments) {
    auto [id, created] = m_subs.add(channel, instruments);
    if (created) {
        tLog_App(QString::fromStdString(std::format("➕ Subscription {} channel={} instruments={}",
            id, ch::name(channel), instruments.size())));
        net::post(m_strand, [this, id = id] {
            if (state() != ConnectionState::Ready) {
                return;
            }
            // flushPending() may already have sent it on the way into Ready
            auto sub = m_subs.find(id);
            if (sub && sub->pending && !sub->inFlight) sendSubscribe(id);
        });
    }
    return id;
}

bool SessionManager::unsubscribe(SubscriptionId id) {
    auto removed = m_subs.remove(id);
    if (!removed) {
        return false;
    }
    tLog_App(QString::fromStdString(std::format("➖ Subscription {} removed", id)));
    if (removed->serverSid) {
        net::post(m_strand, [this, sid = *removed->serverSid] {
            if (state() == ConnectionState::Ready) m_transport.send(m_subs.buildUnsubscribe(sid));
        });
    }
    // Unacked: SubscriptionManager answers the late ack with an unsubscribe.
    return true;
}

void SessionManager::requestSnapshot(const std::string& instrument) {
    net::post(m_strand, [this, instrument] {
        for (auto id : m_subs.orderbookSubscriptionsFor(instrument)) {
            auto sub = m_subs.find(id);
            if (!sub) continue;
            if (sub->inFlight || (sub->pending && state() == ConnectionState::Ready)) {
                // already being resubscribed
                continue;
            }
            auto oldSid = m_subs.beginResubscribe(id);
            if (state() != ConnectionState::Ready) {
                continue;   // resent with a fresh snapshot on the next Ready
            }
            tLog_App(QString::fromStdString(std::format("🔄 Resubscribing {} for a fresh snapshot of {}", id, instrument)));
            if (oldSid) {
                m_transport.send(m_subs.buildUnsubscribe(*oldSid));
            }
            sendSubscribe(id);
        }
    });
}

void SessionManager::forceDegraded(const std::string& reason) {
    net::post(m_strand, [this, reason] {
        const auto s = state();
        if (s == ConnectionState::Connecting || s == ConnectionState::Authenticating || s == ConnectionState::Ready) {
            enterDegraded(reason);
        }
    });
}

void SessionManager::addStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMx);
    m_listeners.push_back(std::move(listener));
}

ConnectionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(m_stateMx);
    return m_state;
}

std::string SessionManager::lastError() const {
    std::lock_guard<std::mutex> lock(m_stateMx);
    return m_lastError;
}

std::chrono::milliseconds SessionManager::lastBackoff() const {
    std::lock_guard<std::mutex> lock(m_stateMx);
    return m_lastBackoff;
}

// ─────────────────────────────────────────────────────────────
// State machine (strand)
// ─────────────────────────────────────────────────────────────

bool SessionManager::transition(ConnectionState to, const std::string& reason) {
    ConnectionState from;
    {
        std::lock_guard<std::mutex> lock(m_stateMx);
        from = m_state;
        if (from == to) {
            return false;
        }
        if (!isTransitionAllowed(from, to)) {
            tLog_Warning(QString("⚠️ Ignoring invalid transition %1 -> %2").arg(toString(from)).arg(toString(to)));
            return false;
        }
        m_state = to;
        if (to == ConnectionState::Degraded || to == ConnectionState::Failed) {
            m_lastError = reason;
        }
    }

    if (reason.empty()) {
        tLog_App(QString("🔁 %1 -> %2").arg(toString(from)).arg(toString(to)));
    } else {
        tLog_App(QString("🔁 %1 -> %2 (%3)").arg(toString(from)).arg(toString(to)).arg(QString::fromStdString(reason)));
    }

    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMx);
        listeners = m_listeners;
    }
    for (const auto& l : listeners) {
        l(from, to, reason);
    }
    return true;
}

void SessionManager::beginConnect() {
    if (m_stopping) {
        return;
    }
    if (!transition(ConnectionState::Connecting)) {
        return;
    }
    m_attempts.fetch_add(1);
    m_authCommandId.reset();
    m_subs.markAllPending();

    HttpHeaders headers;
    if (m_options.authMode == AuthMode::Header) {
        try {
            if (!m_signer) {
                throw CredentialError("no signer configured for header authentication");
            }
            headers = m_signer->sign(upgradeRequest(m_options.endpoint), std::chrono::system_clock::now()).asHttpHeaders();
        } catch (const CredentialError& e) {
            enterFailed(e.what());
            return;
        } catch (const SigningError& e) {
            // Headers are regenerated on the next attempt.
            enterDegraded(e.what());
            return;
        }
    }

    m_transport.connect(m_options.endpoint, std::move(headers));
}

void SessionManager::handleSecured() {
    if (state() == ConnectionState::Connecting) {
        transition(ConnectionState::Authenticating);
    }
}

void SessionManager::handleOpen() {
    if (state() != ConnectionState::Authenticating) {
        return;
    }
    if (m_options.authMode == AuthMode::Message) {
        sendAuthenticate();
    } else {
        becomeReady();
    }
}

void SessionManager::handleFault(const TransportFault& fault) {
    const auto s = state();
    if (s != ConnectionState::Connecting && s != ConnectionState::Authenticating && s != ConnectionState::Ready) {
        return;
    }
    if (fault.kind == TransportFault::Kind::HandshakeRejected && s != ConnectionState::Ready) {
        enterFailed(HandshakeRejected(fault.message, fault.httpStatus).what());
        return;
    }
    enterDegraded(TransportError(fault.message).what());
}

void SessionManager::handleControl(const MarketEventPtr& ev) {
    const auto& h = ev->header;

    if (const auto* ack = std::get_if<CommandAckEvent>(&ev->body)) {
        if (m_authCommandId && h.commandId == m_authCommandId) {
            m_authCommandId.reset();
            if (state() == ConnectionState::Authenticating) {
                becomeReady();
            }
            return;
        }
        if (ack->ackType == ch::kTypeSubscribed && h.commandId) {
            const auto result = m_subs.onSubscribed(*h.commandId, h.sid);
            if (result.orphanSid && state() == ConnectionState::Ready) {
                tLog_App(QString("➖ Late ack for removed subscription; unsubscribing sid %1").arg(*result.orphanSid));
                m_transport.send(m_subs.buildUnsubscribe(*result.orphanSid));
            }
        }
        return;
    }

    if (const auto* err = std::get_if<ProviderErrorEvent>(&ev->body)) {
        if (m_authCommandId && h.commandId == m_authCommandId) {
            m_authCommandId.reset();
            if (state() == ConnectionState::Authenticating) {
                enterFailed(HandshakeRejected(std::format("authenticate rejected: {} ({})", err->message, err->code)).what());
            }
            return;
        }
        if (h.commandId) {
            if (auto sub = m_subs.subscriptionForCommand(*h.commandId)) {
                tLog_Warning(QString::fromStdString(std::format("❌ Subscription {} rejected: {} ({})",
                    *sub, err->message, err->code)));
                m_subs.onSubscribeRejected(*h.commandId);
            }
        }
    }
}

void SessionManager::enterDegraded(const std::string& reason) {
    if (!transition(ConnectionState::Degraded, reason)) {
        return;
    }
    if (m_monitor) m_monitor->recordReconnect();
    m_authCommandId.reset();
    m_subs.markAllPending();
    m_transport.close();
    scheduleReconnect();
}

void SessionManager::enterFailed(const std::string& reason) {
    m_timer.cancel();
    m_transport.close();
    if (transition(ConnectionState::Failed, reason)) {
        tLog_Error(QString("🛑 Session failed; new credentials and start() required: %1").arg(QString::fromStdString(reason)));
    }
}

void SessionManager::scheduleReconnect() {
    if (m_stopping) {
        transition(ConnectionState::Closed, "stopped");
        return;
    }
    const auto delay = m_backoff.nextDelay();
    {
        std::lock_guard<std::mutex> lock(m_stateMx);
        m_lastBackoff = delay;
    }
    tLog_App(QString("⏳ Reconnecting in %1 ms (attempt %2)").arg(delay.count()).arg(m_backoff.attempt()));

    m_timer.expires_after(delay);
    m_timer.async_wait(net::bind_executor(m_strand, [this](const boost::system::error_code& ec) {
        if (ec || m_stopping) {
            return;
        }
        if (state() == ConnectionState::Degraded) {
            beginConnect();
        }
    }));
}

void SessionManager::becomeReady() {
    if (!transition(ConnectionState::Ready)) {
        return;
    }
    m_timer.cancel();
    m_backoff.reset();
    m_dispatcher.resetBreaker();
    flushPending();
}

void SessionManager::sendAuthenticate() {
    try {
        if (!m_signer) {
            throw CredentialError("no signer configured for message authentication");
        }
        const auto headers = m_signer->sign(upgradeRequest(m_options.endpoint), std::chrono::system_clock::now());
        uint64_t cmdId = 0;
        std::string msg = m_subs.buildAuthenticate(headers, cmdId);
        m_authCommandId = cmdId;
        m_transport.send(std::move(msg));

        m_timer.expires_after(m_options.authTimeout);
        m_timer.async_wait(net::bind_executor(m_strand, [this, cmdId](const boost::system::error_code& ec) {
            if (ec || m_stopping) {
                return;
            }
            if (state() == ConnectionState::Authenticating && m_authCommandId == cmdId) {
                enterDegraded(std::format("authenticate timed out after {} ms", m_options.authTimeout.count()));
            }
        }));
    } catch (const CredentialError& e) {
        enterFailed(e.what());
    } catch (const SigningError& e) {
        enterDegraded(e.what());
    }
}

void SessionManager::sendSubscribe(SubscriptionId id) {
    try {
        m_transport.send(m_subs.buildSubscribe(id));
    } catch (const MarketDataError& e) {
        // removed between queueing and sending
        tLog_Debug(e.what());
    }
}

void SessionManager::flushPending() {
    const auto ids = m_subs.pendingIds();
    if (!ids.empty()) {
        tLog_App(QString("📡 Sending %1 subscription(s)").arg(ids.size()));
    }
    for (auto id : ids) {
        sendSubscribe(id);
    }
}

void SessionManager::doStop() {
    m_stopping = true;
    m_timer.cancel();
    const auto s = state();
    if (s == ConnectionState::Closed || s == ConnectionState::Failed) {
        return;
    }
    if (s == ConnectionState::Ready) {
        for (const auto& sub : m_subs.held()) {
            if (sub.serverSid) m_transport.send(m_subs.buildUnsubscribe(*sub.serverSid));
        }
    }
    m_transport.close();
    transition(ConnectionState::Closed, "stopped");
}
