/**
 * @file key_generator.cpp
 * @brief RSA / EC key generation via the EVP_PKEY_CTX interface
 */

#include "ptet/keys/key_generator.h"
#include "exceptions.h"
#include <openssl/ec.h>
#include <openssl/objects.h>
#include <openssl/rsa.h>
#include <spdlog/spdlog.h>

namespace ptet {
namespace keys {

KeyGenerator KeyGenerator::rsa(int bits) {
    return KeyGenerator(Type::Rsa, bits, 0);
}

KeyGenerator KeyGenerator::ec(int curveNid) {
    return KeyGenerator(Type::Ec, 0, curveNid);
}

KeyGenerator KeyGenerator::ecFromCurveName(const std::string& curveName) {
    int nid = OBJ_sn2nid(curveName.c_str());
    if (nid == NID_undef) {
        nid = OBJ_ln2nid(curveName.c_str());
    }
    if (nid == NID_undef) {
        nid = EC_curve_nist2nid(curveName.c_str());
    }
    if (nid == NID_undef) {
        throw common::KeyStoreException("Unknown elliptic curve: " + curveName);
    }
    return ec(nid);
}

PKeyPtr KeyGenerator::generate() const {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(
        type_ == Type::Rsa ? EVP_PKEY_RSA : EVP_PKEY_EC, nullptr);
    if (!ctx) {
        throw common::KeyStoreException(openSslError("EVP_PKEY_CTX_new_id"));
    }

    bool ok = EVP_PKEY_keygen_init(ctx) == 1;
    if (ok && type_ == Type::Rsa) {
        ok = EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits_) == 1;
    } else if (ok) {
        ok = EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, curveNid_) == 1 &&
             EVP_PKEY_CTX_set_ec_param_enc(ctx, OPENSSL_EC_NAMED_CURVE) == 1;
    }

    EVP_PKEY* key = nullptr;
    if (ok) {
        ok = EVP_PKEY_keygen(ctx, &key) == 1;
    }
    EVP_PKEY_CTX_free(ctx);

    if (!ok || !key) {
        throw common::KeyStoreException(openSslError("Key generation failed"));
    }

    if (type_ == Type::Rsa) {
        spdlog::debug("[KeyGenerator] Generated RSA-{} key", bits_);
    } else {
        spdlog::debug("[KeyGenerator] Generated EC key on curve {}", OBJ_nid2sn(curveNid_));
    }
    return adoptPKey(key);
}

} // namespace keys
} // namespace ptet
