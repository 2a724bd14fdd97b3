/**
 * @file pkey.cpp
 * @brief EVP_PKEY PEM conversion
 */

#include "ptet/keys/pkey.h"
#include "exceptions.h"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

namespace ptet {
namespace keys {

namespace {

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<size_t>(length));
}

} // anonymous namespace

std::string openSslError(const std::string& what) {
    std::string message = what;
    unsigned long code;
    bool first = true;
    while ((code = ERR_get_error()) != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += first ? ": " : "; ";
        message += buffer;
        first = false;
    }
    return message;
}

std::string privateKeyToPem(EVP_PKEY* key) {
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        throw common::KeyStoreException(openSslError("BIO_new"));
    }
    if (PEM_write_bio_PKCS8PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        BIO_free(bio);
        throw common::KeyStoreException(openSslError("PEM_write_bio_PKCS8PrivateKey"));
    }
    std::string pem = bioToString(bio);
    BIO_free(bio);
    return pem;
}

std::string publicKeyToPem(EVP_PKEY* key) {
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        throw common::KeyStoreException(openSslError("BIO_new"));
    }
    if (PEM_write_bio_PUBKEY(bio, key) != 1) {
        BIO_free(bio);
        throw common::KeyStoreException(openSslError("PEM_write_bio_PUBKEY"));
    }
    std::string pem = bioToString(bio);
    BIO_free(bio);
    return pem;
}

PKeyPtr privateKeyFromPem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        throw common::KeyStoreException(openSslError("BIO_new_mem_buf"));
    }
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!key) {
        throw common::KeyStoreException(openSslError("Cannot parse private key PEM"));
    }
    return adoptPKey(key);
}

PKeyPtr publicKeyFromPem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        throw common::KeyStoreException(openSslError("BIO_new_mem_buf"));
    }
    EVP_PKEY* key = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!key) {
        throw common::KeyStoreException(openSslError("Cannot parse public key PEM"));
    }
    return adoptPKey(key);
}

bool publicEquals(EVP_PKEY* a, EVP_PKEY* b) {
    if (!a || !b) {
        return false;
    }
    return EVP_PKEY_eq(a, b) == 1;
}

} // namespace keys
} // namespace ptet
