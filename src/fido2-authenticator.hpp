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

#ifndef GPOKTA_FIDO2_AUTHENTICATOR_HPP
#define GPOKTA_FIDO2_AUTHENTICATOR_HPP

#include "authenticator.hpp"

namespace gpokta {

/**
 * @brief Authenticator talking CTAP2 to USB HID security keys through libfido2.
 */
class Fido2Authenticator : public Authenticator
{
public:
  Fido2Authenticator();

  bool
  isDeviceAvailable() override;

  Assertion
  getAssertion(const AssertionRequest& request, AuthenticatorInteraction& interaction) override;

  /**
   * @brief The clientDataJSON a browser would send for @p request.
   */
  static std::string
  makeClientDataJson(const AssertionRequest& request);

  /**
   * @brief Strip the CBOR byte string header libfido2 leaves around authenticator data.
   * @throw Error @p data is not a CBOR byte string
   */
  static std::vector<uint8_t>
  decodeAuthenticatorData(const uint8_t* data, size_t size);

private:
  std::string m_devicePath;
};

} // namespace gpokta

#endif // GPOKTA_FIDO2_AUTHENTICATOR_HPP
