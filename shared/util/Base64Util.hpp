#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

namespace shared::util {

/**
 * Base64 / Base64url encoding utility using OpenSSL.
 *
 * JWT segments use the URL-safe alphabet without padding (RFC 7515 section 2).
 */
class Base64Util {
public:
    /**
     * Encode binary data to standard Base64 string.
     */
    static std::string encode(const std::vector<uint8_t>& data) {
        return encode(data.data(), data.size());
    }

    /**
     * Encode raw bytes to standard Base64 string.
     */
    static std::string encode(const uint8_t* data, size_t length) {
        if (length == 0) {
            return "";
        }

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new(BIO_s_mem());
        b64 = BIO_push(b64, mem);

        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        BIO_write(b64, data, static_cast<int>(length));
        BIO_flush(b64);

        BUF_MEM* bufferPtr;
        BIO_get_mem_ptr(b64, &bufferPtr);

        std::string result(bufferPtr->data, bufferPtr->length);
        BIO_free_all(b64);

        return result;
    }

    /**
     * Decode standard Base64 string to binary data.
     */
    static std::vector<uint8_t> decode(const std::string& encoded) {
        if (encoded.empty()) {
            return {};
        }

        size_t decodedLength = (encoded.length() * 3) / 4;
        std::vector<uint8_t> result(decodedLength);

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new_mem_buf(encoded.c_str(), static_cast<int>(encoded.length()));
        mem = BIO_push(b64, mem);

        BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
        int actualLength = BIO_read(mem, result.data(), static_cast<int>(result.size()));
        BIO_free_all(mem);

        if (actualLength < 0) {
            throw std::runtime_error("Base64 decoding failed");
        }

        result.resize(static_cast<size_t>(actualLength));
        return result;
    }

    /**
     * Encode bytes as unpadded Base64url.
     */
    static std::string encodeUrl(const uint8_t* data, size_t length) {
        std::string result = encode(data, length);
        for (char& c : result) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        while (!result.empty() && result.back() == '=') {
            result.pop_back();
        }
        return result;
    }

    static std::string encodeUrl(const std::string& text) {
        return encodeUrl(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    static std::string encodeUrl(const std::vector<uint8_t>& data) {
        return encodeUrl(data.data(), data.size());
    }

    /**
     * Decode unpadded Base64url. Throws on characters outside the alphabet
     * and on impossible lengths.
     */
    static std::vector<uint8_t> decodeUrl(const std::string& encoded) {
        if (encoded.length() % 4 == 1) {
            throw std::runtime_error("Invalid base64url length");
        }

        std::string standard;
        standard.reserve(encoded.length() + 3);
        for (char c : encoded) {
            if (c == '-') {
                standard.push_back('+');
            } else if (c == '_') {
                standard.push_back('/');
            } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9')) {
                standard.push_back(c);
            } else {
                throw std::runtime_error("Invalid base64url character");
            }
        }
        while (standard.length() % 4 != 0) {
            standard.push_back('=');
        }
        return decode(standard);
    }

    static std::string decodeUrlToString(const std::string& encoded) {
        auto bytes = decodeUrl(encoded);
        return std::string(bytes.begin(), bytes.end());
    }
};

} // namespace shared::util
