/**
 * @file key_generator.h
 * @brief Parameters for generating a new signing key
 *
 * @date 2026-03-24
 */

#pragma once

#include "ptet/keys/pkey.h"
#include <string>

namespace ptet {
namespace keys {

/**
 * @brief Key generator: RSA with a bit size, or EC on a named curve
 *
 * Usage:
 * @code
 *   auto key = KeyGenerator::rsa(2048).generate();
 *   auto ec  = KeyGenerator::ecFromCurveName("secp521r1").generate();
 * @endcode
 */
class KeyGenerator {
public:
    enum class Type { Rsa, Ec };

    static KeyGenerator rsa(int bits);

    /**
     * @param curveNid OpenSSL NID of a named curve (e.g. NID_secp521r1)
     */
    static KeyGenerator ec(int curveNid);

    /**
     * @param curveName Short or long OpenSSL curve name ("prime256v1", "secp521r1")
     * @throws common::KeyStoreException for unknown curves
     */
    static KeyGenerator ecFromCurveName(const std::string& curveName);

    /**
     * @brief Generate a private key with the configured parameters
     * @throws common::KeyStoreException on OpenSSL failure
     */
    PKeyPtr generate() const;

    Type type() const { return type_; }
    int bits() const { return bits_; }
    int curveNid() const { return curveNid_; }

private:
    KeyGenerator(Type type, int bits, int curveNid)
        : type_(type), bits_(bits), curveNid_(curveNid) {}

    Type type_;
    int bits_;
    int curveNid_;
};

} // namespace keys
} // namespace ptet
