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

#include "tests/test-common.hpp"

#include <iomanip>
#include <sstream>

namespace gpokta::tests {

static std::string
toHex(const std::vector<uint8_t>& bytes)
{
  std::ostringstream os;
  for (auto b : bytes) {
    os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return os.str();
}

static std::vector<uint8_t>
toBytes(const std::string& s)
{
  return std::vector<uint8_t>(s.begin(), s.end());
}

BOOST_AUTO_TEST_SUITE(TestCryptoHelpers)

BOOST_AUTO_TEST_CASE(Base64)
{
  BOOST_CHECK_EQUAL(base64Encode(toBytes("")), "");
  BOOST_CHECK_EQUAL(base64Encode(toBytes("f")), "Zg==");
  BOOST_CHECK_EQUAL(base64Encode(toBytes("foobar")), "Zm9vYmFy");

  auto decoded = base64Decode("Zm9v\nYmE=");
  BOOST_CHECK_EQUAL(std::string(decoded.begin(), decoded.end()), "fooba");

  BOOST_CHECK_THROW(base64Decode("Zm9"), ProtocolViolation);
  BOOST_CHECK_THROW(base64Decode("Zm9v-mFy"), ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(WebsafeBase64)
{
  std::vector<uint8_t> data{0xfb, 0xff, 0xbf, 0x01};
  BOOST_CHECK_EQUAL(base64Encode(data), "+/+/AQ==");
  BOOST_CHECK_EQUAL(websafeBase64Encode(data), "-_-_AQ");

  auto decoded = websafeBase64Decode("-_-_AQ");
  BOOST_CHECK_EQUAL_COLLECTIONS(decoded.begin(), decoded.end(), data.begin(), data.end());
  decoded = websafeBase64Decode("-_-_AQ==");
  BOOST_CHECK_EQUAL_COLLECTIONS(decoded.begin(), decoded.end(), data.begin(), data.end());

  BOOST_CHECK_THROW(websafeBase64Decode("+/+/AQ"), ProtocolViolation);
  BOOST_CHECK_THROW(websafeBase64Decode("AAAAA"), ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(Base32)
{
  auto decoded = base32Decode("MZXW6YTBOI======");
  BOOST_CHECK_EQUAL(std::string(decoded.begin(), decoded.end()), "foobar");
  decoded = base32Decode("mzxw 6ytb oi");
  BOOST_CHECK_EQUAL(std::string(decoded.begin(), decoded.end()), "foobar");

  BOOST_CHECK_THROW(base32Decode("MZXW1"), ConfigError);
}

BOOST_AUTO_TEST_CASE(HmacSha1)
{
  // RFC 2202 test case 1
  std::vector<uint8_t> key(20, 0x0b);
  std::string data = "Hi There";
  auto mac = hmacSha1(reinterpret_cast<const uint8_t*>(data.data()), data.size(), key.data(), key.size());
  BOOST_CHECK_EQUAL(toHex(mac), "b617318655057264e28bc0b6fb378c8ef146be00");
}

BOOST_AUTO_TEST_CASE(Sha256)
{
  std::string data = "abc";
  auto digest = sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  BOOST_CHECK_EQUAL(toHex(digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

BOOST_AUTO_TEST_SUITE_END() // TestCryptoHelpers

} // namespace gpokta::tests
