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

#include "detail/totp.hpp"
#include "detail/crypto-helpers.hpp"
#include "error.hpp"

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <iomanip>
#include <sstream>

namespace gpokta {

Totp::Totp(const std::string& base32Secret, size_t digits, time::seconds step)
  : Totp(base32Decode(base32Secret), digits, step)
{
}

Totp::Totp(std::vector<uint8_t> key, size_t digits, time::seconds step)
  : m_key(std::move(key))
  , m_digits(digits)
  , m_step(step)
{
  if (m_key.empty()) {
    NDN_THROW(ConfigError("TOTP secret is empty"));
  }
  if (m_digits < 6 || m_digits > 9) {
    NDN_THROW(ConfigError("TOTP code length must be between 6 and 9 digits"));
  }
  if (m_step <= time::seconds::zero()) {
    NDN_THROW(ConfigError("TOTP time step must be positive"));
  }
}

std::string
Totp::now() const
{
  return at(time::system_clock::now());
}

std::string
Totp::at(const time::system_clock::TimePoint& tp) const
{
  auto elapsed = time::duration_cast<time::seconds>(time::toUnixTimestamp(tp));
  return generate(static_cast<uint64_t>(elapsed.count() / m_step.count()));
}

std::string
Totp::generate(uint64_t counter) const
{
  uint8_t message[8];
  boost::endian::native_to_big_inplace(counter);
  std::memcpy(message, &counter, sizeof(message));

  auto digest = hmacSha1(message, sizeof(message), m_key.data(), m_key.size());

  // dynamic truncation, RFC 4226 section 5.3
  size_t offset = digest.back() & 0x0F;
  uint32_t binary = (static_cast<uint32_t>(digest[offset] & 0x7F) << 24) |
                    (static_cast<uint32_t>(digest[offset + 1]) << 16) |
                    (static_cast<uint32_t>(digest[offset + 2]) << 8) |
                    static_cast<uint32_t>(digest[offset + 3]);

  uint64_t modulus = 1;
  for (size_t i = 0; i < m_digits; ++i) {
    modulus *= 10;
  }

  std::ostringstream os;
  os << std::setw(static_cast<int>(m_digits)) << std::setfill('0') << (binary % modulus);
  return os.str();
}

} // namespace gpokta
