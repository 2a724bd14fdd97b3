/**
 * @file key_cache.cpp
 * @brief KeyCache implementation
 */

#include "ptet/keys/key_cache.h"
#include "ptet/utils/string_utils.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>

namespace ptet {
namespace keys {

KeyCache::KeyCache(KeyStore keyStore)
    : keyStore_(std::move(keyStore))
{
    defaultKeyId_ = keyStore_.defaultKeyId();
    if (!defaultKeyId_) {
        auto keyIds = keyStore_.keyIdList();
        if (!keyIds.empty()) {
            keyStore_.makeDefault(keyIds.back());
            defaultKeyId_ = keyIds.back();
        }
    }

    if (defaultKeyId_) {
        spdlog::debug("[KeyCache] Opened {} (default key: {})",
                      keyStore_.baseDir().string(), *defaultKeyId_);
    } else {
        spdlog::debug("[KeyCache] Opened {} (no default key)", keyStore_.baseDir().string());
    }
}

KeyCache KeyCache::fromPath(const std::filesystem::path& path) {
    return KeyCache(KeyStore(path));
}

KeyCache::KeyCache(KeyCache&& other) noexcept
    : keyStore_(std::move(other.keyStore_)),
      privateKeys_(std::move(other.privateKeys_)),
      publicKeys_(std::move(other.publicKeys_)),
      defaultKeyId_(std::move(other.defaultKeyId_))
{
}

ResolvedKey KeyCache::createPrivateKey(const std::optional<std::string>& keyId,
                                       const std::optional<KeyGenerator>& generator) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = keyId ? *keyId : utils::randomAlphanumeric(DEFAULT_KEY_ID_LEN);
    KeyGenerator gen = generator ? *generator : KeyGenerator::rsa(DEFAULT_RSA_BITS);

    PKeyPtr key = keyStore_.createKeyPair(id, gen);

    if (!defaultKeyId_) {
        keyStore_.makeDefault(id);
        defaultKeyId_ = id;
    }

    privateKeys_[id] = key;
    return ResolvedKey{key, id};
}

std::string KeyCache::resolveKeyId(const std::optional<std::string>& keyId) const {
    if (keyId) {
        return *keyId;
    }
    if (defaultKeyId_) {
        return *defaultKeyId_;
    }
    throw common::KeyStoreException("key_id is None and no default key could be obtained");
}

ResolvedKey KeyCache::getPrivateKey(const std::optional<std::string>& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = resolveKeyId(keyId);
    auto it = privateKeys_.find(id);
    if (it == privateKeys_.end()) {
        it = privateKeys_.emplace(id, keyStore_.loadPrivateKey(id)).first;
        spdlog::debug("[KeyCache] Loaded private key '{}'", id);
    }
    return ResolvedKey{it->second, id};
}

ResolvedKey KeyCache::getPublicKey(const std::optional<std::string>& keyId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = resolveKeyId(keyId);
    auto it = publicKeys_.find(id);
    if (it == publicKeys_.end()) {
        it = publicKeys_.emplace(id, keyStore_.loadPublicKey(id)).first;
        spdlog::debug("[KeyCache] Loaded public key '{}'", id);
    }
    return ResolvedKey{it->second, id};
}

std::vector<std::string> KeyCache::keyIdList() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keyStore_.keyIdList();
}

std::optional<std::string> KeyCache::defaultKeyId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultKeyId_;
}

} // namespace keys
} // namespace ptet
