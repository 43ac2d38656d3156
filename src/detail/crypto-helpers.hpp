/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024, The gp-okta Authors.
 *
 * This file is part of gp-okta, a GlobalProtect login helper for Okta SSO.
 *
 * gp-okta is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * gp-okta is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * gp-okta, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of gp-okta authors and contributors.
 */

#ifndef GPOKTA_DETAIL_CRYPTO_HELPERS_HPP
#define GPOKTA_DETAIL_CRYPTO_HELPERS_HPP

#include "detail/gpokta-common.hpp"

namespace gpokta {

/**
 * @brief Standard base64 (RFC 4648 section 4) with padding and without line breaks.
 */
std::string
base64Encode(const uint8_t* data, size_t dataLen);

std::string
base64Encode(const std::vector<uint8_t>& data);

/**
 * @brief Decode standard base64, ignoring embedded whitespace.
 * @throw ProtocolViolation the input is not valid base64
 */
std::vector<uint8_t>
base64Decode(const std::string& encoded);

/**
 * @brief URL-safe base64 (RFC 4648 section 5) without padding, as used by WebAuthn.
 */
std::string
websafeBase64Encode(const std::vector<uint8_t>& data);

/**
 * @brief Decode URL-safe base64; padding is optional.
 * @throw ProtocolViolation the input is not valid base64
 */
std::vector<uint8_t>
websafeBase64Decode(const std::string& encoded);

/**
 * @brief Decode RFC 4648 base32 as used for TOTP shared secrets.
 *
 * Lower case letters are accepted, spaces, dashes and trailing '=' are ignored.
 *
 * @throw ConfigError the input contains a character outside the base32 alphabet
 */
std::vector<uint8_t>
base32Decode(const std::string& encoded);

/**
 * @brief HMAC based on SHA-1.
 *
 * @param data The input array to hmac.
 * @param dataLen The length of the input array.
 * @param key The HMAC key.
 * @param keyLen The length of the HMAC key.
 * @return the 20-byte digest
 * @throw std::runtime_error when an error occurred in the underlying HMAC.
 */
std::vector<uint8_t>
hmacSha1(const uint8_t* data, size_t dataLen,
         const uint8_t* key, size_t keyLen);

/**
 * @brief SHA-256 digest of @p data.
 */
std::vector<uint8_t>
sha256(const uint8_t* data, size_t dataLen);

} // namespace gpokta

#endif // GPOKTA_DETAIL_CRYPTO_HELPERS_HPP
