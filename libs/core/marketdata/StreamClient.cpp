#include "StreamClient.hpp"
#include "auth/CredentialProvider.hpp"
#include "auth/Signer.hpp"
#include "dispatch/MessageDispatcher.hpp"
#include "dispatch/WorkerPool.hpp"
#include "errors/MarketDataErrors.hpp"
#include "handlers/MarketDataHandlers.hpp"
#include "store/SqliteEventStore.hpp"
#include "ws/BeastWsTransport.hpp"
#include "ws/SessionManager.hpp"
#include "TaplineLogging.hpp"
#include <QMetaObject>
#include <QPointer>
#include <chrono>

StreamClient::StreamClient(StreamConfig config, QObject* parent)
    : StreamClient(std::move(config), nullptr, parent)
{}

StreamClient::StreamClient(StreamConfig config, std::shared_ptr<const ISigner> signer, QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    m_config.validate();

    m_signer = std::move(signer);
    if (!m_signer && m_config.authMode != AuthMode::None) {
        m_signer = std::make_shared<Signer>(CredentialProvider::load(m_config));
    }

    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(boost::asio::ssl::verify_peer);

    SqliteStoreOptions storeOpts;
    storeOpts.path = m_config.dbPath;
    storeOpts.writeRetries = m_config.writeRetries;
    storeOpts.retryBackoff = m_config.writeRetryBackoff;
    storeOpts.batchSize = m_config.writeBatchSize;
    m_store = std::make_unique<SqliteEventStore>(std::move(storeOpts), &m_monitor);

    m_pool = std::make_unique<WorkerPool>(m_config.workerCount, m_config.queueCapacity);
    m_pool->setDropListener([this] { m_monitor.recordBackpressureDrop(); });

    m_dispatcher = std::make_unique<MessageDispatcher>(*m_pool, &m_monitor,
                                                       m_config.malformedThreshold, m_config.malformedWindow);

    m_handlers = std::make_unique<MarketDataHandlers>(*m_store, &m_monitor,
                                                      m_config.recentCapacity, m_config.fatalErrorCodes);
    m_handlers->attach(*m_dispatcher);

    BeastTransportOptions transportOpts;
    transportOpts.pingInterval = m_config.pingInterval;
    transportOpts.readTimeout = m_config.readTimeout;
    m_transport = std::make_unique<BeastWsTransport>(m_ioc, m_sslCtx, transportOpts);

    m_session = std::make_unique<SessionManager>(m_ioc, *m_transport, *m_dispatcher, m_signer,
                                                 SessionOptions::fromConfig(m_config), &m_monitor);
    m_handlers->setSessionControl(m_session.get());
    m_session->addStateListener([this](ConnectionState from, ConnectionState to, const std::string& reason) {
        m_handlers->onSessionState(to);
        onStateChanged(from, to, reason);
    });

    tLog_App(QString("StreamClient ready: endpoint=%1 auth=%2 workers=%3")
                 .arg(QString::fromStdString(m_config.endpoint()))
                 .arg(toString(m_config.authMode))
                 .arg(m_config.workerCount));
}

StreamClient::~StreamClient() {
    stop();
    if (m_pool) {
        m_pool->stop();
    }
    if (m_handlers) {
        m_handlers->setSessionControl(nullptr);
        m_handlers->detach();
    }
}

void StreamClient::start() {
    launch(nullptr);
}

void StreamClient::launch(std::shared_ptr<const ISigner> freshSigner) {
    if (m_running) {
        return;
    }
    m_running = true;

    m_workGuard.emplace(m_ioc.get_executor());
    m_ioc.restart();
    m_ioThread = std::thread([this] {
        m_ioc.run();
        tLog_Data("IO context stopped");
    });

    m_session->start(std::move(freshSigner));
}

void StreamClient::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;

    m_session->stop();

    // stop() lands in Closed on the io thread; wait briefly so unsubscribes and the close frame go out.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        const auto s = m_session->state();
        if (s == ConnectionState::Closed || s == ConnectionState::Failed) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    m_workGuard.reset();
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }

    m_pool->drain();
    m_store->flush();
    tLog_App(m_monitor.statusLine());
    tLog_App("StreamClient stopped");
}

void StreamClient::restart(std::shared_ptr<const ISigner> freshSigner) {
    if (freshSigner) {
        m_signer = freshSigner;
    }
    if (!m_running) {
        launch(std::move(freshSigner));
        return;
    }
    m_session->start(std::move(freshSigner));
}

SubscriptionId StreamClient::subscribe(ChannelKind channel, const std::vector<std::string>& instruments) {
    return m_session->subscribe(channel, instruments);
}

bool StreamClient::unsubscribe(SubscriptionId id) {
    return m_session->unsubscribe(id);
}

void StreamClient::subscribeConfigured() {
    for (const auto& spec : m_config.subscriptions) {
        auto kind = ch::parse(spec.channel);
        if (!kind) {
            throw ConfigError("unknown channel '" + spec.channel + "'");
        }
        subscribe(*kind, spec.instruments);
    }
}

ConnectionState StreamClient::state() const {
    return m_session->state();
}

const LatestStateCache& StreamClient::cache() const {
    return m_handlers->cache();
}

const IMarketDataQueries& StreamClient::queries() const {
    return *m_store;
}

void StreamClient::onStateChanged(ConnectionState, ConnectionState to, const std::string& reason) {
    QPointer<StreamClient> self(this);
    const QString stateName = QString::fromLatin1(toString(to));
    const QString why = QString::fromStdString(reason);

    QMetaObject::invokeMethod(this, [self, to, stateName, why] {
        if (!self) return;
        emit self->connectionStateChanged(stateName);
        if (to == ConnectionState::Degraded) {
            emit self->errorOccurred(why);
        } else if (to == ConnectionState::Failed) {
            emit self->fatalError(why);
        }
    }, Qt::QueuedConnection);
}
