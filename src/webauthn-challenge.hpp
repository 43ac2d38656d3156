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

#ifndef GPOKTA_WEBAUTHN_CHALLENGE_HPP
#define GPOKTA_WEBAUTHN_CHALLENGE_HPP

#include "authenticator.hpp"
#include "authn-response.hpp"
#include "http-transport.hpp"

namespace gpokta {

/**
 * @brief Answers a webauthn factor with a local hardware authenticator.
 *
 * The generic webauthn verification endpoint is used rather than a factor's own verify link,
 * so any of the user's enrolled keys can answer.
 */
class WebauthnChallenge : boost::noncopyable
{
public:
  WebauthnChallenge(HttpTransport& transport, Authenticator& authenticator,
                    UserInteraction& userInteraction, AuthenticatorInteraction& authInteraction);

  /**
   * @brief Find a device, asking the user to insert one while none is attached.
   * @return false if the user chose to fall back to another factor
   */
  bool
  acquireDevice();

  /**
   * @brief Run the challenge for the authentication transaction @p stateToken.
   * @return the provider's response to the submitted assertion
   * @throw UnexpectedStatus the provider did not issue a challenge
   * @throw ProtocolViolation the challenge lacks its nonce or next link
   */
  AuthnResponse
  verify(const std::string& domain, const std::string& stateToken);

  static std::string
  getVerifyUrl(const std::string& domain);

  /**
   * @brief Convert a URL-safe unpadded field to standard padded base64.
   */
  static std::string
  toTransportEncoding(const std::string& websafe);

GPOKTA_PUBLIC_WITH_TESTS_ELSE_PRIVATE:
  static AssertionRequest
  makeAssertionRequest(const std::string& domain, const AuthnResponse& challenge);

private:
  HttpTransport& m_transport;
  Authenticator& m_authenticator;
  UserInteraction& m_userInteraction;
  AuthenticatorInteraction& m_authInteraction;
};

} // namespace gpokta

#endif // GPOKTA_WEBAUTHN_CHALLENGE_HPP
