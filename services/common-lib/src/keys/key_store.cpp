/**
 * @file key_store.cpp
 * @brief KeyStore implementation
 */

#include "ptet/keys/key_store.h"
#include "ptet/utils/string_utils.h"
#include "exceptions.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ptet {
namespace keys {

namespace {

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw common::KeyStoreException("Cannot write file " + path.string());
    }
    out << content;
    if (!out) {
        throw common::KeyStoreException("Cannot write file " + path.string());
    }
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw common::KeyStoreException("Cannot read file " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void validateKeyId(const std::string& keyId) {
    if (keyId.empty() || keyId == "." || keyId == ".." ||
        keyId.find('/') != std::string::npos || keyId.find('\\') != std::string::npos) {
        throw common::KeyStoreException("Invalid key ID: '" + keyId + "'");
    }
}

} // anonymous namespace

KeyStore::KeyStore(fs::path baseDir)
    : baseDir_(std::move(baseDir))
{
}

fs::path KeyStore::keyDir(const std::string& keyId) const {
    validateKeyId(keyId);
    return baseDir_ / (std::string(KEY_DIR_PREFIX) + keyId);
}

PKeyPtr KeyStore::createKeyPair(const std::string& keyId, const KeyGenerator& generator) const {
    fs::path path = keyDir(keyId);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        throw common::KeyStoreException("Key already exists");
    }

    fs::create_directories(path, ec);
    if (ec) {
        throw common::KeyStoreException("Cannot create key directory " + path.string() +
                                        ": " + ec.message());
    }

    PKeyPtr privateKey = generator.generate();

    fs::path privatePath = path / PRIVATE_PEM;
    writeFile(privatePath, privateKeyToPem(privateKey.get()));
    fs::permissions(privatePath, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("[KeyStore] Cannot restrict permissions of {}: {}",
                     privatePath.string(), ec.message());
    }

    writeFile(path / PUBLIC_PEM, publicKeyToPem(privateKey.get()));

    spdlog::info("[KeyStore] Created key pair '{}' in {}", keyId, path.string());
    return privateKey;
}

PKeyPtr KeyStore::loadPublicKey(const std::string& keyId) const {
    fs::path path = keyDir(keyId) / PUBLIC_PEM;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw common::KeyStoreException("Public key file not found");
    }
    return publicKeyFromPem(readFile(path));
}

PKeyPtr KeyStore::loadPrivateKey(const std::string& keyId) const {
    fs::path path = keyDir(keyId) / PRIVATE_PEM;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw common::KeyStoreException("Private key file not found");
    }
    return privateKeyFromPem(readFile(path));
}

std::vector<std::string> KeyStore::keyIdList() const {
    std::vector<std::string> keyIds;
    std::error_code ec;
    fs::directory_iterator it(baseDir_, ec);
    if (ec) {
        throw common::KeyStoreException("Cannot read key directory " + baseDir_.string() +
                                        ": " + ec.message());
    }

    const std::string prefix = KEY_DIR_PREFIX;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (entry.is_directory(ec) && utils::startsWith(name, prefix) && name.size() > prefix.size()) {
            keyIds.push_back(name.substr(prefix.size()));
        }
    }
    std::sort(keyIds.begin(), keyIds.end());
    return keyIds;
}

void KeyStore::makeDefault(const std::string& keyId) const {
    validateKeyId(keyId);
    writeFile(baseDir_ / DEFAULT_TXT, keyId);
    spdlog::info("[KeyStore] Default key set to '{}'", keyId);
}

std::optional<std::string> KeyStore::defaultKeyId() const {
    fs::path path = baseDir_ / DEFAULT_TXT;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::string keyId = utils::trim(readFile(path));
    if (keyId.empty()) {
        return std::nullopt;
    }
    return keyId;
}

} // namespace keys
} // namespace ptet
