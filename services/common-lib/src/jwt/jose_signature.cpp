/**
 * @file jose_signature.cpp
 * @brief EVP_DigestSign / EVP_DigestVerify with DER <-> JOSE ECDSA conversion
 */

#include "jose_signature.h"
#include "ptet/keys/pkey.h"
#include "exceptions.h"
#include <memory>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>

namespace ptet {
namespace jwt {
namespace jose {

namespace {

struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
struct EcdsaSigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };
struct BignumDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

bool isEc(EVP_PKEY* key) {
    return EVP_PKEY_get_base_id(key) == EVP_PKEY_EC;
}

size_t ecComponentSize(EVP_PKEY* key) {
    // For EC keys EVP_PKEY_get_bits() is the bit length of the group order
    return static_cast<size_t>((EVP_PKEY_get_bits(key) + 7) / 8);
}

std::vector<uint8_t> derToJose(EVP_PKEY* key, const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
    if (!sig) {
        throw common::TokenException(keys::openSslError("d2i_ECDSA_SIG"));
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    size_t n = ecComponentSize(key);
    std::vector<uint8_t> jose(2 * n);
    if (BN_bn2binpad(r, jose.data(), static_cast<int>(n)) < 0 ||
        BN_bn2binpad(s, jose.data() + n, static_cast<int>(n)) < 0) {
        throw common::TokenException(keys::openSslError("BN_bn2binpad"));
    }
    return jose;
}

std::vector<uint8_t> joseToDer(EVP_PKEY* key, const std::vector<uint8_t>& jose) {
    size_t n = ecComponentSize(key);
    if (jose.size() != 2 * n) {
        return {};
    }

    BignumPtr r(BN_bin2bn(jose.data(), static_cast<int>(n), nullptr));
    BignumPtr s(BN_bin2bn(jose.data() + n, static_cast<int>(n), nullptr));
    EcdsaSigPtr sig(ECDSA_SIG_new());
    if (!r || !s || !sig || ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        return {};
    }
    // Ownership of r and s moved into sig
    r.release();
    s.release();

    int len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (len <= 0) {
        return {};
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* out = der.data();
    i2d_ECDSA_SIG(sig.get(), &out);
    return der;
}

} // anonymous namespace

std::string algorithmFor(EVP_PKEY* key) {
    switch (EVP_PKEY_get_base_id(key)) {
        case EVP_PKEY_RSA:
            return "RS512";
        case EVP_PKEY_EC:
            return "ES512";
        default:
            throw common::TokenException("Unsupported key type for signing");
    }
}

std::vector<uint8_t> sign(EVP_PKEY* key, const std::string& input) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha512(), nullptr, key) != 1) {
        throw common::TokenException(keys::openSslError("EVP_DigestSignInit"));
    }

    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t sigLen = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, data, input.size()) != 1) {
        throw common::TokenException(keys::openSslError("EVP_DigestSign"));
    }
    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, data, input.size()) != 1) {
        throw common::TokenException(keys::openSslError("EVP_DigestSign"));
    }
    signature.resize(sigLen);

    if (isEc(key)) {
        return derToJose(key, signature);
    }
    return signature;
}

bool verify(EVP_PKEY* key, const std::string& input, const std::vector<uint8_t>& signature) {
    std::vector<uint8_t> raw = isEc(key) ? joseToDer(key, signature) : signature;
    ERR_clear_error();
    if (raw.empty()) {
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha512(), nullptr, key) != 1) {
        throw common::TokenException(keys::openSslError("EVP_DigestVerifyInit"));
    }

    int rc = EVP_DigestVerify(ctx.get(), raw.data(), raw.size(),
                              reinterpret_cast<const unsigned char*>(input.data()), input.size());
    if (rc != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace jose
} // namespace jwt
} // namespace ptet
