/*
Tapline — Signer
Role: RSA-PSS request signing on top of jwt-cpp's ps256 algorithm object.
Threading: All methods execute on the calling thread; sign() does not mutate state.
Related: Signer.hpp.
Assumptions: jwt-cpp's ps256 uses PSS padding with salt length equal to the SHA-256 digest length.
*/
#include "Signer.hpp"
#include "../errors/MarketDataErrors.hpp"
#include <jwt-cpp/jwt.h>
#include <system_error>
#include <utility>

Signer::Signer(Credential credential)
    : m_keyId(std::move(credential.keyId))
{
    if (m_keyId.empty()) {
        throw CredentialError("key id is empty");
    }
    if (credential.privateKeyPem.empty()) {
        throw CredentialError("private key is empty");
    }
    try {
        // Public key left empty: jwt-cpp derives it from the private key.
        m_algorithm = std::make_unique<jwt::algorithm::ps256>("", credential.privateKeyPem);
    } catch (const std::exception& ex) {
        throw CredentialError(std::string("private key is not a usable RSA PEM: ") + ex.what());
    }
}

Signer::~Signer() = default;
Signer::Signer(Signer&&) noexcept = default;
Signer& Signer::operator=(Signer&&) noexcept = default;

SignatureHeaders Signer::sign(const RequestDescriptor& request,
                              std::chrono::system_clock::time_point now) const {
    if (!m_algorithm) {
        throw SigningError("signer has no key (moved-from)");
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    SignatureHeaders out;
    out.keyId = m_keyId;
    out.timestamp = std::to_string(ms);

    const std::string message = out.timestamp + request.method + request.path;

    std::error_code ec;
    const std::string raw = m_algorithm->sign(message, ec);
    if (ec) {
        throw SigningError("RSA-PSS sign failed: " + ec.message());
    }
    if (raw.empty()) {
        throw SigningError("RSA-PSS sign produced an empty signature");
    }

    out.signature = jwt::base::encode<jwt::alphabet::base64>(raw);
    return out;
}
