#pragma once
/*
Tapline — SessionManager
Role: Owns the connection lifecycle: sign, dial, authenticate, resubscribe, and reconnect with
      backoff, expressed as the ConnectionState machine.
Inputs/Outputs: Drives a WsTransport; receives its callbacks and the dispatcher's control events
                (acks/errors); notifies StateListeners on every transition.
Threading: All work runs on the session's own strand. state() may be read from any thread
           (mutex-guarded); listeners are invoked outside that lock, on the strand.
Cancellation: stop() is observed by the reconnect timer immediately and always ends in Closed.
Observability: Every transition is logged on tapline.app with its reason.
Related: SessionManager.cpp, SubscriptionManager.hpp, BackoffPolicy.hpp, BeastWsTransport.hpp.
*/
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include "BackoffPolicy.hpp"
#include "ConnectionState.hpp"
#include "ISessionControl.hpp"
#include "SubscriptionManager.hpp"
#include "WsTransport.hpp"
#include "../auth/ISigner.hpp"
#include "../model/MarketEvents.hpp"

class MessageDispatcher;
class StreamMonitor;

struct SessionOptions {
    AuthMode                  authMode{AuthMode::Header};
    WsEndpoint                endpoint;
    std::chrono::milliseconds authTimeout{std::chrono::seconds(10)};   // wait for the authenticate ack
    std::chrono::milliseconds backoffBase{std::chrono::seconds(1)};
    std::chrono::milliseconds backoffMax{std::chrono::seconds(60)};
    double                    backoffJitter{0.2};
    std::optional<uint64_t>   backoffSeed;      // fixed seed for reproducible schedules
    bool                      preserveSubscriptionIds{false};

    static SessionOptions fromConfig(const StreamConfig& config);
};

class SessionManager : public ISessionControl {
public:
    using StateListener = std::function<void(ConnectionState from, ConnectionState to, const std::string& reason)>;

    SessionManager(boost::asio::io_context& ioc,
                   WsTransport& transport,
                   MessageDispatcher& dispatcher,
                   std::shared_ptr<const ISigner> signer,
                   SessionOptions options,
                   StreamMonitor* monitor = nullptr);
    ~SessionManager() override;

    SessionManager(const SessionManager&)            = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Leaves Idle/Closed/Failed for Connecting. A non-null signer replaces the current one.
    void start(std::shared_ptr<const ISigner> freshSigner = nullptr);

    /// Idempotent. Cancels any pending reconnect, unsubscribes best-effort when Ready, closes.
    void stop();

    /// Queued until Ready; equivalent requests return the existing id.
    SubscriptionId subscribe(ChannelKind channel, const std::vector<std::string>& instruments);
    bool           unsubscribe(SubscriptionId id);

    // ISessionControl
    void requestSnapshot(const std::string& instrument) override;
    void forceDegraded(const std::string& reason) override;

    void addStateListener(StateListener listener);

    [[nodiscard]] ConnectionState           state() const;
    [[nodiscard]] std::string               lastError() const;
    [[nodiscard]] std::chrono::milliseconds lastBackoff() const;
    [[nodiscard]] std::vector<Subscription> subscriptions() const { return m_subs.held(); }
    [[nodiscard]] uint64_t                  connectAttempts() const noexcept { return m_attempts.load(); }

private:
    static bool acceptsFrames(ConnectionState s) noexcept;
    bool transition(ConnectionState to, const std::string& reason = {});

    void beginConnect();
    void handleSecured();
    void handleOpen();
    void handleFault(const TransportFault& fault);
    void handleControl(const MarketEventPtr& ev);
    void enterDegraded(const std::string& reason);
    void enterFailed(const std::string& reason);
    void scheduleReconnect();
    void becomeReady();
    void sendAuthenticate();
    void sendSubscribe(SubscriptionId id);
    void flushPending();
    void doStop();

    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    Strand                         m_strand;
    boost::asio::steady_timer      m_timer;
    WsTransport&                   m_transport;
    MessageDispatcher&             m_dispatcher;
    std::shared_ptr<const ISigner> m_signer;        // strand-confined
    SessionOptions                 m_options;
    StreamMonitor*                 m_monitor;
    BackoffPolicy                  m_backoff;       // strand-confined
    SubscriptionManager            m_subs;

    std::optional<uint64_t>        m_authCommandId; // strand-confined
    std::atomic<bool>              m_stopping{false};
    std::atomic<uint64_t>          m_attempts{0};

    mutable std::mutex             m_stateMx;
    ConnectionState                m_state{ConnectionState::Idle};
    std::string                    m_lastError;
    std::chrono::milliseconds      m_lastBackoff{0};

    std::mutex                     m_listenerMx;
    std::vector<StateListener>     m_listeners;
};
