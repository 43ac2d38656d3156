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

#ifndef GPOKTA_DETAIL_TOTP_HPP
#define GPOKTA_DETAIL_TOTP_HPP

#include "detail/gpokta-common.hpp"

namespace gpokta {

/**
 * @brief Time-based one-time password generator (RFC 6238, HMAC-SHA1).
 *
 * Parameters match the authenticator apps Okta enrolls: 6 digits, 30 second time step,
 * Unix epoch as T0.
 */
class Totp
{
public:
  /**
   * @param base32Secret the shared secret as shown during enrollment
   * @throw ConfigError the secret is not valid base32 or is empty
   */
  explicit
  Totp(const std::string& base32Secret, size_t digits = 6, time::seconds step = time::seconds(30));

  Totp(std::vector<uint8_t> key, size_t digits, time::seconds step);

  /**
   * @brief Code for the current time of time::system_clock.
   */
  std::string
  now() const;

  std::string
  at(const time::system_clock::TimePoint& tp) const;

  /**
   * @brief Code for an explicit time-step counter value.
   */
  std::string
  generate(uint64_t counter) const;

private:
  std::vector<uint8_t> m_key;
  size_t m_digits;
  time::seconds m_step;
};

} // namespace gpokta

#endif // GPOKTA_DETAIL_TOTP_HPP
