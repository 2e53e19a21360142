#include "StreamConfig.hpp"
#include "../errors/MarketDataErrors.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

const char* toString(AuthMode mode) {
    switch (mode) {
        case AuthMode::Header:  return "header";
        case AuthMode::Message: return "message";
        case AuthMode::None:    return "none";
    }
    return "header";
}

namespace {

AuthMode parseAuthMode(const std::string& s) {
    if (s == "header")  return AuthMode::Header;
    if (s == "message") return AuthMode::Message;
    if (s == "none")    return AuthMode::None;
    throw ConfigError("auth_mode must be one of header|message|none, got '" + s + "'");
}

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
    }
}

void readMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    readIfPresent(j, key, ms);
    if (ms < 0) throw ConfigError(std::string(key) + " must be non-negative");
    out = std::chrono::milliseconds(ms);
}

std::string envOr(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

} // namespace

StreamConfig StreamConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("failed to open config file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
    return fromJson(j);
}

StreamConfig StreamConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("top-level config must be an object");
    }

    StreamConfig c;
    readIfPresent(j, "ws_url", c.wsUrl);
    readIfPresent(j, "demo_ws_url", c.demoWsUrl);
    readIfPresent(j, "use_demo", c.useDemo);

    std::string mode = toString(c.authMode);
    readIfPresent(j, "auth_mode", mode);
    c.authMode = parseAuthMode(mode);
    readIfPresent(j, "key_id", c.keyId);
    readIfPresent(j, "private_key_path", c.privateKeyPath);

    readMillis(j, "ping_interval_ms", c.pingInterval);
    readMillis(j, "read_timeout_ms", c.readTimeout);
    readMillis(j, "auth_timeout_ms", c.authTimeout);
    readMillis(j, "backoff_base_ms", c.backoffBase);
    readMillis(j, "backoff_max_ms", c.backoffMax);
    readIfPresent(j, "backoff_jitter", c.backoffJitter);
    readIfPresent(j, "preserve_subscription_ids", c.preserveSubscriptionIds);

    readIfPresent(j, "worker_count", c.workerCount);
    readIfPresent(j, "queue_capacity", c.queueCapacity);
    readIfPresent(j, "malformed_threshold", c.malformedThreshold);
    readMillis(j, "malformed_window_ms", c.malformedWindow);
    readIfPresent(j, "fatal_error_codes", c.fatalErrorCodes);

    readIfPresent(j, "recent_capacity", c.recentCapacity);

    readIfPresent(j, "db_path", c.dbPath);
    readIfPresent(j, "write_retries", c.writeRetries);
    readMillis(j, "write_retry_backoff_ms", c.writeRetryBackoff);
    readIfPresent(j, "write_batch_size", c.writeBatchSize);

    int64_t statusSecs = c.statusInterval.count();
    readIfPresent(j, "status_interval_s", statusSecs);
    c.statusInterval = std::chrono::seconds(statusSecs);

    if (auto it = j.find("subscriptions"); it != j.end()) {
        if (!it->is_array()) throw ConfigError("subscriptions must be an array");
        for (const auto& s : *it) {
            SubscriptionSpec spec;
            readIfPresent(s, "channel", spec.channel);
            readIfPresent(s, "instruments", spec.instruments);
            c.subscriptions.push_back(std::move(spec));
        }
    }

    c.validate();
    return c;
}

void StreamConfig::applyEnvironment() {
    keyId          = envOr("TAPLINE_KEY_ID", keyId);
    privateKeyPath = envOr("TAPLINE_PRIVATE_KEY_PATH", privateKeyPath);
    dbPath         = envOr("TAPLINE_DB_PATH", dbPath);
    const char* url = std::getenv("TAPLINE_WS_URL");
    if (url && *url) {
        wsUrl = url;
        useDemo = false;
    }
}

void StreamConfig::validate() const {
    if (workerCount == 0)         throw ConfigError("worker_count must be at least 1");
    if (queueCapacity == 0)       throw ConfigError("queue_capacity must be at least 1");
    if (malformedThreshold == 0)  throw ConfigError("malformed_threshold must be at least 1");
    if (recentCapacity == 0)      throw ConfigError("recent_capacity must be at least 1");
    if (writeBatchSize == 0)      throw ConfigError("write_batch_size must be at least 1");
    if (writeRetries < 0)         throw ConfigError("write_retries must be non-negative");
    if (backoffBase.count() <= 0) throw ConfigError("backoff_base_ms must be positive");
    if (backoffMax < backoffBase) throw ConfigError("backoff_max_ms must be >= backoff_base_ms");
    if (backoffJitter < 0.0 || backoffJitter > 1.0) {
        throw ConfigError("backoff_jitter must be within [0, 1]");
    }
    if (pingInterval.count() <= 0) throw ConfigError("ping_interval_ms must be positive");
    if (readTimeout.count() <= 0)  throw ConfigError("read_timeout_ms must be positive");
    if (authTimeout.count() <= 0)  throw ConfigError("auth_timeout_ms must be positive");
    if (statusInterval.count() <= 0) throw ConfigError("status_interval_s must be positive");
    for (const auto& s : subscriptions) {
        if (s.channel.empty()) throw ConfigError("subscription without a channel");
    }
    if (!WsEndpoint::parse(endpoint()).tls) {
        throw ConfigError("ws_url must use wss://");
    }
}

WsEndpoint WsEndpoint::parse(const std::string& url) {
    WsEndpoint ep;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        ep.tls = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        ep.tls = false;
        rest = url.substr(5);
    } else {
        throw ConfigError("websocket url must start with ws:// or wss://: " + url);
    }

    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    ep.target = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }
    if (ep.host.empty() || ep.port.empty()) {
        throw ConfigError("websocket url has no host: " + url);
    }
    return ep;
}
