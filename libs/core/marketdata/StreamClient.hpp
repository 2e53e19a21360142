#pragma once
/*
Tapline — StreamClient
Role: Facade that builds and owns the ingestion pipeline and its threads.
Inputs/Outputs: StreamConfig in; subscriptions via subscribe(); state changes and errors out as
                Qt signals; cached state and stored history through cache() / queries().
Threading: Public methods are called from the owning (Qt) thread. Owns the io_context thread,
           the WorkerPool threads and the store's writer thread.
Integration: Created by apps/stream_cli; signals are queued to the owning thread.
Observability: connectionStateChanged on every transition; errorOccurred for Degraded;
               fatalError for Failed.
Related: StreamClient.cpp, SessionManager.hpp, MessageDispatcher.hpp, SqliteEventStore.hpp.
Assumptions: Constructed after QCoreApplication when signals are consumed.
*/
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <QObject>
#include <QString>
#include "StreamMonitor.hpp"
#include "auth/ISigner.hpp"
#include "config/StreamConfig.hpp"
#include "ws/ConnectionState.hpp"
#include "ws/SubscriptionManager.hpp"

class WorkerPool;
class MessageDispatcher;
class MarketDataHandlers;
class LatestStateCache;
class SqliteEventStore;
class IMarketDataQueries;
class BeastWsTransport;
class SessionManager;

class StreamClient : public QObject {
    Q_OBJECT

public:
    /// Throws ConfigError, CredentialError or StoreWriteError when the pipeline cannot be built.
    explicit StreamClient(StreamConfig config, QObject* parent = nullptr);

    /// Uses the given signer instead of loading credentials from the config.
    StreamClient(StreamConfig config, std::shared_ptr<const ISigner> signer, QObject* parent = nullptr);
    ~StreamClient() override;

    void start();
    void stop();

    /// Re-enter Connecting from Failed/Closed, optionally with new credentials.
    void restart(std::shared_ptr<const ISigner> freshSigner = nullptr);

    SubscriptionId subscribe(ChannelKind channel, const std::vector<std::string>& instruments);
    bool           unsubscribe(SubscriptionId id);

    /// Subscribes everything listed under "subscriptions" in the config.
    void subscribeConfigured();

    [[nodiscard]] ConnectionState           state() const;
    [[nodiscard]] const StreamMonitor&      monitor() const noexcept { return m_monitor; }
    [[nodiscard]] const LatestStateCache&   cache() const;
    [[nodiscard]] const IMarketDataQueries& queries() const;
    [[nodiscard]] const StreamConfig&       config() const noexcept { return m_config; }

    // Non-copyable, non-movable (manages threads)
    StreamClient(const StreamClient&)            = delete;
    StreamClient& operator=(const StreamClient&) = delete;
    StreamClient(StreamClient&&)                 = delete;
    StreamClient& operator=(StreamClient&&)      = delete;

signals:
    void connectionStateChanged(const QString& state);
    void errorOccurred(const QString& error);
    void fatalError(const QString& error);

private:
    void launch(std::shared_ptr<const ISigner> freshSigner);
    void onStateChanged(ConnectionState from, ConnectionState to, const std::string& reason);

    StreamConfig  m_config;
    StreamMonitor m_monitor;

    boost::asio::io_context  m_ioc;
    boost::asio::ssl::context m_sslCtx{boost::asio::ssl::context::tlsv12_client};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    std::thread              m_ioThread;

    // Declaration order is teardown order in reverse: the session goes first.
    std::unique_ptr<SqliteEventStore>   m_store;
    std::unique_ptr<WorkerPool>         m_pool;
    std::unique_ptr<MessageDispatcher>  m_dispatcher;
    std::unique_ptr<MarketDataHandlers> m_handlers;
    std::unique_ptr<BeastWsTransport>   m_transport;
    std::shared_ptr<const ISigner>      m_signer;
    std::unique_ptr<SessionManager>     m_session;

    bool m_running{false};
};
