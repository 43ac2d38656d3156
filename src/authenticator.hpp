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

#ifndef GPOKTA_AUTHENTICATOR_HPP
#define GPOKTA_AUTHENTICATOR_HPP

#include "user-interaction.hpp"

namespace gpokta {

/**
 * @brief A WebAuthn credential request.
 */
struct AssertionRequest
{
  std::string origin;
  std::string rpId;
  std::vector<uint8_t> challenge;
  /**
   * @brief Raw credential ids, any of which may answer.
   */
  std::vector<std::vector<uint8_t>> allowCredentials;
};

/**
 * @brief A signed assertion, every field in URL-safe unpadded base64.
 */
struct Assertion
{
  std::string authenticatorData;
  std::string clientData;
  std::string signature;
};

/**
 * @brief A local hardware authenticator.
 */
class Authenticator : boost::noncopyable
{
public:
  virtual
  ~Authenticator() = default;

  /**
   * @brief Enumerate attached devices.
   * @return true if a compatible device is present
   */
  virtual bool
  isDeviceAvailable() = 0;

  /**
   * @brief Obtain an assertion from the device found by the last isDeviceAvailable().
   * @throw DeviceUnavailable no device is attached anymore
   * @throw UserCancelled the user declined to enter a PIN
   */
  virtual Assertion
  getAssertion(const AssertionRequest& request, AuthenticatorInteraction& interaction) = 0;
};

} // namespace gpokta

#endif // GPOKTA_AUTHENTICATOR_HPP
