#pragma once
/*
Tapline — ISigner
Role: Seam between the session and request signing so tests can substitute a fake.
Related: Signer.hpp, SessionManager.hpp, tests/marketdata/fixtures/mock_signer.hpp.
*/
#include <chrono>
#include <string>
#include <utility>
#include <vector>

struct RequestDescriptor {
    std::string method;     // "GET"
    std::string path;       // "/trade-api/ws/v2"
};

struct SignatureHeaders {
    std::string keyId;
    std::string signature;  // base64
    std::string timestamp;  // milliseconds since epoch, decimal

    // Header name/value pairs for the HTTP upgrade request.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> asHttpHeaders() const {
        return {
            {"KALSHI-ACCESS-KEY", keyId},
            {"KALSHI-ACCESS-SIGNATURE", signature},
            {"KALSHI-ACCESS-TIMESTAMP", timestamp},
        };
    }
};

class ISigner {
public:
    virtual ~ISigner() = default;

    /// Produces fresh headers for one request. Throws SigningError.
    [[nodiscard]] virtual SignatureHeaders sign(const RequestDescriptor& request,
                                                std::chrono::system_clock::time_point now) const = 0;
};
