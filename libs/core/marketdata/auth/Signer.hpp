#pragma once
/*
Tapline — Signer
Role: Signs WebSocket upgrade requests with the venue's RSA-PSS scheme.
Inputs/Outputs: Message = timestampMs + METHOD + path; RSA-PSS/SHA-256 (salt = digest length),
                base64-encoded, returned as SignatureHeaders.
Threading: sign() is const and holds no mutable state; safe from any thread.
Performance: One RSA private-key operation per connection attempt.
Integration: Constructed from a Credential; owned by StreamClient and shared with SessionManager.
Observability: Failures surface as SigningError; key material is never logged.
Related: CredentialProvider.hpp, ISigner.hpp.
*/
#include "ISigner.hpp"
#include "CredentialProvider.hpp"
#include <memory>

namespace jwt::algorithm { struct ps256; }

class Signer : public ISigner {
public:
    /// Parses the PEM up front. Throws CredentialError if it is not a usable RSA private key.
    explicit Signer(Credential credential);
    ~Signer() override;

    [[nodiscard]] SignatureHeaders sign(const RequestDescriptor& request,
                                        std::chrono::system_clock::time_point now) const override;

    [[nodiscard]] const std::string& keyId() const noexcept { return m_keyId; }

    // Non-copyable, movable.
    Signer(const Signer&)            = delete;
    Signer& operator=(const Signer&) = delete;
    Signer(Signer&&) noexcept;
    Signer& operator=(Signer&&) noexcept;

private:
    std::string m_keyId;
    std::unique_ptr<jwt::algorithm::ps256> m_algorithm;   // holds the parsed private key
};
