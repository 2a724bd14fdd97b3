/**
 * @file key_store.h
 * @brief Filesystem facade over signing key pairs
 *
 * Layout below the base directory:
 * @code
 *   <base>/default.txt          id of the default key
 *   <base>/key_<id>/private.pem PKCS#8
 *   <base>/key_<id>/public.pem  SubjectPublicKeyInfo
 * @endcode
 *
 * @date 2026-03-24
 */

#pragma once

#include "ptet/keys/key_generator.h"
#include "ptet/keys/pkey.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ptet {
namespace keys {

class KeyStore {
public:
    explicit KeyStore(std::filesystem::path baseDir);

    /**
     * @brief Create and persist a key pair with ID keyId
     * @throws common::KeyStoreException "Key already exists" if the key directory exists
     */
    PKeyPtr createKeyPair(const std::string& keyId, const KeyGenerator& generator) const;

    /**
     * @throws common::KeyStoreException "Public key file not found" or parse errors
     */
    PKeyPtr loadPublicKey(const std::string& keyId) const;

    /**
     * @throws common::KeyStoreException "Private key file not found" or parse errors
     */
    PKeyPtr loadPrivateKey(const std::string& keyId) const;

    /**
     * @brief IDs of all key directories, sorted
     * @throws common::KeyStoreException when the base directory cannot be read
     */
    std::vector<std::string> keyIdList() const;

    /** Persist keyId as the default key */
    void makeDefault(const std::string& keyId) const;

    /** Default key ID from default.txt, if the file exists */
    std::optional<std::string> defaultKeyId() const;

    const std::filesystem::path& baseDir() const { return baseDir_; }

private:
    static constexpr const char* KEY_DIR_PREFIX = "key_";
    static constexpr const char* DEFAULT_TXT = "default.txt";
    static constexpr const char* PUBLIC_PEM = "public.pem";
    static constexpr const char* PRIVATE_PEM = "private.pem";

    std::filesystem::path keyDir(const std::string& keyId) const;

    std::filesystem::path baseDir_;
};

} // namespace keys
} // namespace ptet
