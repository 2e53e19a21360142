#pragma once
/*
Tapline — CredentialProvider
Role: Loads the API key id and RSA private key PEM named by StreamConfig.
Inputs/Outputs: Reads the PEM file once at startup; returns an immutable Credential.
Threading: Call from the startup thread; the result is handed to Signer by value.
Observability: Logs the key id and path on success. Never logs key material.
Assumptions: Key id and path come from config, optionally overridden by
             TAPLINE_KEY_ID / TAPLINE_PRIVATE_KEY_PATH (applied by StreamConfig).
*/
#include <string>

struct StreamConfig;

struct Credential {
    std::string keyId;
    std::string privateKeyPem;
};

class CredentialProvider {
public:
    /// Throws CredentialError when the id is empty or the key file is missing/unreadable/empty.
    [[nodiscard]] static Credential load(const StreamConfig& config);

    /// Same as load() but with explicit inputs.
    [[nodiscard]] static Credential load(const std::string& keyId, const std::string& privateKeyPath);
};
