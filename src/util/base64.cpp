/**
 * @file base64.cpp
 * @brief Base64 helpers built on OpenSSL BIO filters
 */

#include <idp/dc/util/base64.h>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace idp::dc::util {

std::string base64Encode(const std::string& bytes) {
    if (bytes.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, bytes.data(), static_cast<int>(bytes.size()));
    BIO_flush(b64);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(b64, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);

    return result;
}

std::string base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return "";
    }

    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("Invalid Base64 length");
    }

    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') {
        padding = encoded[encoded.size() - 2] == '=' ? 2 : 1;
    }

    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '=') {
            // padding only as the final one or two characters
            if (i < encoded.size() - padding) {
                throw std::invalid_argument("Misplaced Base64 padding");
            }
            continue;
        }
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!ok) {
            throw std::invalid_argument("Invalid Base64 character");
        }
    }

    const size_t expectedLength = (encoded.size() / 4) * 3 - padding;

    std::string result((encoded.length() * 3) / 4 + 1, '\0');

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.length()));
    mem = BIO_push(b64, mem);

    BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
    int actualLength = BIO_read(mem, result.data(), static_cast<int>(result.size()));
    BIO_free_all(mem);

    if (actualLength < 0 || static_cast<size_t>(actualLength) != expectedLength) {
        throw std::invalid_argument("Base64 decoding failed");
    }

    result.resize(static_cast<size_t>(actualLength));
    return result;
}

} // namespace idp::dc::util
