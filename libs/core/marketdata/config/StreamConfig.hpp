#pragma once
/*
Tapline — StreamConfig
Role: Every tunable of the ingestion pipeline, with defaults matching the venue's recommendations.
Inputs/Outputs: fromFile() / fromJson() parse JSON; applyEnvironment() layers TAPLINE_* overrides.
Threading: Plain value type; copied into each component at construction.
Observability: Invalid values throw ConfigError naming the offending key.
Related: config/tapline.example.json, apps/stream_cli/stream_main.cpp.
*/
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

enum class AuthMode {
    Header,     // signed headers on the HTTP upgrade
    Message,    // "authenticate" command after the upgrade
    None        // public channels only
};

const char* toString(AuthMode mode);

struct SubscriptionSpec {
    std::string              channel;
    std::vector<std::string> instruments;
};

struct StreamConfig {
    // Endpoint
    std::string wsUrl{"wss://api.elections.kalshi.com/trade-api/ws/v2"};
    std::string demoWsUrl{"wss://demo-api.kalshi.co/trade-api/ws/v2"};
    bool        useDemo{false};

    // Credentials
    AuthMode    authMode{AuthMode::Header};
    std::string keyId;
    std::string privateKeyPath;

    // Transport
    std::chrono::milliseconds pingInterval{std::chrono::seconds(20)};
    std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds authTimeout{std::chrono::seconds(10)};   // message auth only

    // Reconnect
    std::chrono::milliseconds backoffBase{std::chrono::seconds(1)};
    std::chrono::milliseconds backoffMax{std::chrono::seconds(60)};
    double                    backoffJitter{0.2};
    bool                      preserveSubscriptionIds{false};

    // Dispatch
    std::size_t               workerCount{2};
    std::size_t               queueCapacity{4096};
    std::size_t               malformedThreshold{20};
    std::chrono::milliseconds malformedWindow{std::chrono::seconds(10)};
    std::vector<int>          fatalErrorCodes{9, 17};

    // Handlers
    std::size_t recentCapacity{256};

    // Store
    std::string               dbPath{"tapline.db"};
    int                       writeRetries{3};
    std::chrono::milliseconds writeRetryBackoff{50};
    std::size_t               writeBatchSize{256};

    // CLI
    std::chrono::seconds          statusInterval{30};
    std::vector<SubscriptionSpec> subscriptions;

    /// The URL actually dialed (demo or production).
    [[nodiscard]] const std::string& endpoint() const noexcept { return useDemo ? demoWsUrl : wsUrl; }

    /// Throws ConfigError on unreadable files, bad JSON or invalid values.
    static StreamConfig fromFile(const std::string& path);
    static StreamConfig fromJson(const nlohmann::json& j);

    /// Applies TAPLINE_KEY_ID, TAPLINE_PRIVATE_KEY_PATH, TAPLINE_DB_PATH, TAPLINE_WS_URL.
    void applyEnvironment();

    /// Throws ConfigError when a combination of values is unusable.
    void validate() const;
};

// Splits "wss://host[:port]/path" into its parts. Throws ConfigError.
struct WsEndpoint {
    std::string host;
    std::string port;
    std::string target;
    bool        tls{true};

    static WsEndpoint parse(const std::string& url);
};
