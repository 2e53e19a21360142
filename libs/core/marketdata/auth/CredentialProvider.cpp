#include "CredentialProvider.hpp"
#include "../config/StreamConfig.hpp"
#include "../errors/MarketDataErrors.hpp"
#include "TaplineLogging.hpp"
#include <fstream>
#include <sstream>

Credential CredentialProvider::load(const StreamConfig& config) {
    return load(config.keyId, config.privateKeyPath);
}

Credential CredentialProvider::load(const std::string& keyId, const std::string& privateKeyPath) {
    if (keyId.empty()) {
        throw CredentialError("key id missing (set key_id or TAPLINE_KEY_ID)");
    }
    if (privateKeyPath.empty()) {
        throw CredentialError("private key path missing (set private_key_path or TAPLINE_PRIVATE_KEY_PATH)");
    }

    std::ifstream in(privateKeyPath, std::ios::binary);
    if (!in.is_open()) {
        throw CredentialError("failed to open private key file: " + privateKeyPath);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw CredentialError("failed to read private key file: " + privateKeyPath);
    }

    Credential c;
    c.keyId = keyId;
    c.privateKeyPem = buf.str();
    if (c.privateKeyPem.find("PRIVATE KEY") == std::string::npos) {
        throw CredentialError("file does not contain a PEM private key: " + privateKeyPath);
    }

    tLog_App(QString("Loaded credentials for key %1 from %2")
                 .arg(QString::fromStdString(keyId), QString::fromStdString(privateKeyPath)));
    return c;
}
