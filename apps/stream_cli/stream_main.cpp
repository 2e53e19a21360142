/*
Tapline — tapline_stream
Role: Headless ingestion service: load config, start the stream, report status until SIGINT/SIGTERM.
Exit codes: 0 on clean shutdown, 1 on configuration/credential/store errors at startup.
*/
#include "marketdata/StreamClient.hpp"
#include "marketdata/config/StreamConfig.hpp"
#include "marketdata/errors/MarketDataErrors.hpp"
#include "TaplineLogging.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <memory>

namespace {
std::atomic<bool> g_quitRequested{false};

void onSignal(int) {
    g_quitRequested.store(true);
}
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tapline_stream");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Real-time market data ingestion into SQLite");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt({"c", "config"}, "Path to the JSON config file.", "path");
    QCommandLineOption demoOpt("demo", "Use the demo environment endpoint.");
    QCommandLineOption dbOpt("db", "SQLite database path (overrides config).", "path");
    parser.addOption(configOpt);
    parser.addOption(demoOpt);
    parser.addOption(dbOpt);
    parser.process(app);

    std::unique_ptr<StreamClient> client;
    try {
        StreamConfig config = parser.isSet(configOpt)
            ? StreamConfig::fromFile(parser.value(configOpt).toStdString())
            : StreamConfig{};
        config.applyEnvironment();
        if (parser.isSet(demoOpt)) config.useDemo = true;
        if (parser.isSet(dbOpt))   config.dbPath = parser.value(dbOpt).toStdString();
        config.validate();

        client = std::make_unique<StreamClient>(std::move(config));
        client->subscribeConfigured();
    } catch (const MarketDataError& e) {
        tLog_Error("🛑 Startup failed:" << e.what());
        return 1;
    }

    QObject::connect(client.get(), &StreamClient::connectionStateChanged, [](const QString& s) {
        tLog_App("Connection state:" << s);
    });
    QObject::connect(client.get(), &StreamClient::errorOccurred, [](const QString& e) {
        tLog_Warning("⚠️ Stream degraded:" << e);
    });
    QObject::connect(client.get(), &StreamClient::fatalError, [](const QString& e) {
        // Keep running and reporting; operator must fix credentials and restart.
        tLog_Error("🛑 Stream failed:" << e);
    });

    QTimer status;
    QObject::connect(&status, &QTimer::timeout, [&client] {
        tLog_App(QString("[%1] %2").arg(toString(client->state())).arg(client->monitor().statusLine()));
    });
    status.start(std::chrono::duration_cast<std::chrono::milliseconds>(client->config().statusInterval));

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    QTimer quitPoll;
    QObject::connect(&quitPoll, &QTimer::timeout, [&app] {
        if (g_quitRequested.load()) app.quit();
    });
    quitPoll.start(100);

    client->start();
    const int rc = app.exec();
    client->stop();
    return rc;
}
