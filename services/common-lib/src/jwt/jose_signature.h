/**
 * @file jose_signature.h
 * @brief JWS signing primitives over OpenSSL EVP (RS512 / ES512)
 *
 * ECDSA signatures are exchanged in the JOSE form (RFC 7518 section 3.4):
 * fixed-width big-endian r followed by s, each as long as the curve order.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace ptet {
namespace jwt {
namespace jose {

/**
 * @brief JWS "alg" value for a key when hashing with SHA-512
 * @throws common::TokenException for key types other than RSA and EC
 */
std::string algorithmFor(EVP_PKEY* key);

/**
 * @brief Sign input with SHA-512
 * @throws common::TokenException on OpenSSL failure
 */
std::vector<uint8_t> sign(EVP_PKEY* key, const std::string& input);

/**
 * @brief Verify a JOSE signature with SHA-512
 * @return false for a wrong or malformed signature
 */
bool verify(EVP_PKEY* key, const std::string& input, const std::vector<uint8_t>& signature);

} // namespace jose
} // namespace jwt
} // namespace ptet
