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

#include "detail/crypto-helpers.hpp"
#include "error.hpp"

#include <ndn-cxx/encoding/buffer-stream.hpp>
#include <ndn-cxx/security/transform/base64-decode.hpp>
#include <ndn-cxx/security/transform/base64-encode.hpp>
#include <ndn-cxx/security/transform/buffer-source.hpp>
#include <ndn-cxx/security/transform/stream-sink.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace gpokta {

namespace t = ndn::security::transform;

std::string
base64Encode(const uint8_t* data, size_t dataLen)
{
  std::ostringstream os;
  t::bufferSource(data, dataLen) >> t::base64Encode(false) >> t::streamSink(os);
  return os.str();
}

std::string
base64Encode(const std::vector<uint8_t>& data)
{
  return base64Encode(data.data(), data.size());
}

std::vector<uint8_t>
base64Decode(const std::string& encoded)
{
  std::string input;
  input.reserve(encoded.size());
  std::remove_copy_if(encoded.begin(), encoded.end(), std::back_inserter(input),
                      [] (char c) { return std::isspace(static_cast<unsigned char>(c)); });
  if (input.size() % 4 != 0 ||
      input.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=")
        != std::string::npos) {
    NDN_THROW(ProtocolViolation("Malformed base64 input"));
  }

  ndn::OBufferStream os;
  try {
    t::bufferSource(input) >> t::base64Decode(false) >> t::streamSink(os);
  }
  catch (const t::Error& e) {
    NDN_THROW_NESTED(ProtocolViolation("Malformed base64 input: "s + e.what()));
  }
  auto buf = os.buf();
  return std::vector<uint8_t>(buf->begin(), buf->end());
}

std::string
websafeBase64Encode(const std::vector<uint8_t>& data)
{
  auto encoded = base64Encode(data);
  std::replace(encoded.begin(), encoded.end(), '+', '-');
  std::replace(encoded.begin(), encoded.end(), '/', '_');
  boost::algorithm::trim_right_if(encoded, boost::algorithm::is_any_of("="));
  return encoded;
}

std::vector<uint8_t>
websafeBase64Decode(const std::string& encoded)
{
  if (encoded.find_first_of("+/") != std::string::npos) {
    NDN_THROW(ProtocolViolation("Malformed URL-safe base64 input"));
  }
  std::string standard = boost::algorithm::trim_right_copy_if(encoded, boost::algorithm::is_any_of("="));
  std::replace(standard.begin(), standard.end(), '-', '+');
  std::replace(standard.begin(), standard.end(), '_', '/');
  if (standard.size() % 4 == 1) {
    NDN_THROW(ProtocolViolation("Malformed URL-safe base64 input"));
  }
  standard.append((4 - standard.size() % 4) % 4, '=');
  return base64Decode(standard);
}

std::vector<uint8_t>
base32Decode(const std::string& encoded)
{
  static const std::string ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

  std::vector<uint8_t> result;
  uint32_t buffer = 0;
  int bits = 0;
  for (char c : encoded) {
    if (c == ' ' || c == '-' || c == '=') {
      continue;
    }
    auto pos = ALPHABET.find(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (pos == std::string::npos) {
      NDN_THROW(ConfigError("Invalid character in base32 secret"));
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(pos);
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      result.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
    }
  }
  return result;
}

std::vector<uint8_t>
hmacSha1(const uint8_t* data, size_t dataLen,
         const uint8_t* key, size_t keyLen)
{
  std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
  unsigned int resultLen = 0;
  auto ret = HMAC(EVP_sha1(), key, static_cast<int>(keyLen), data, dataLen, result.data(), &resultLen);
  if (ret == nullptr) {
    NDN_THROW(std::runtime_error("Error computing HMAC when calling HMAC()"));
  }
  result.resize(resultLen);
  return result;
}

std::vector<uint8_t>
sha256(const uint8_t* data, size_t dataLen)
{
  std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
  unsigned int resultLen = 0;
  if (EVP_Digest(data, dataLen, result.data(), &resultLen, EVP_sha256(), nullptr) != 1) {
    NDN_THROW(std::runtime_error("Error computing SHA-256 when calling EVP_Digest()"));
  }
  result.resize(resultLen);
  return result;
}

} // namespace gpokta
