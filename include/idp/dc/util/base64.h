/**
 * @file base64.h
 * @brief Base64 encoding for binary attribute values (OpenSSL BIO)
 */

#pragma once

#include <string>

namespace idp::dc::util {

/**
 * @brief Encode raw bytes without line breaks
 */
std::string base64Encode(const std::string& bytes);

/**
 * @brief Decode Base64 text
 * @throws std::invalid_argument if the input is not valid Base64
 */
std::string base64Decode(const std::string& encoded);

} // namespace idp::dc::util
