/**
 * @file key_cache.h
 * @brief In-memory cache in front of a KeyStore
 *
 * Resolves the default key, creates new keys and keeps loaded keys in
 * memory. All public methods are serialised by an internal mutex, so
 * one instance can be shared by the HTTP worker threads.
 *
 * @date 2026-03-24
 */

#pragma once

#include "ptet/keys/key_generator.h"
#include "ptet/keys/key_store.h"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ptet {
namespace keys {

/// A key together with the ID it was resolved to
struct ResolvedKey {
    PKeyPtr key;
    std::string keyId;
};

class KeyCache {
public:
    static constexpr size_t DEFAULT_KEY_ID_LEN = 16;
    static constexpr int DEFAULT_RSA_BITS = 2048;

    /**
     * @brief Open the cache on a key store
     *
     * Reads default.txt; when it is missing, the last key of the sorted
     * key list becomes the default and is persisted.
     *
     * @throws common::KeyStoreException when the key directory is unreadable
     */
    explicit KeyCache(KeyStore keyStore);

    static KeyCache fromPath(const std::filesystem::path& path);

    KeyCache(const KeyCache&) = delete;
    KeyCache& operator=(const KeyCache&) = delete;
    KeyCache(KeyCache&& other) noexcept;

    /**
     * @brief Create and cache a new private key
     *
     * @param keyId Key ID, random 16 alphanumeric characters when empty
     * @param generator Generator, RSA-2048 when empty
     * @return created key and its ID; the first key becomes the default
     */
    ResolvedKey createPrivateKey(const std::optional<std::string>& keyId = std::nullopt,
                                 const std::optional<KeyGenerator>& generator = std::nullopt);

    /**
     * @brief Private key by ID, or the default key when keyId is empty
     * @throws common::KeyStoreException when neither keyId nor a default is available
     */
    ResolvedKey getPrivateKey(const std::optional<std::string>& keyId = std::nullopt);

    /**
     * @brief Public key by ID, or the default key when keyId is empty
     */
    ResolvedKey getPublicKey(const std::optional<std::string>& keyId = std::nullopt);

    std::vector<std::string> keyIdList() const;

    std::optional<std::string> defaultKeyId() const;

private:
    std::string resolveKeyId(const std::optional<std::string>& keyId) const;

    KeyStore keyStore_;
    std::map<std::string, PKeyPtr> privateKeys_;
    std::map<std::string, PKeyPtr> publicKeys_;
    std::optional<std::string> defaultKeyId_;
    mutable std::mutex mutex_;
};

} // namespace keys
} // namespace ptet
