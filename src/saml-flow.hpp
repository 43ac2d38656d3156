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

#ifndef GPOKTA_SAML_FLOW_HPP
#define GPOKTA_SAML_FLOW_HPP

#include "factor-negotiator.hpp"
#include "detail/url-helpers.hpp"

namespace gpokta {

/**
 * @brief The identity provider's SAML response, ready to be posted to the gateway.
 */
struct SamlAssertion
{
  std::string url;
  FormFields fields;
};

/**
 * @brief What the VPN client needs to connect: the gateway's view of the user name and
 *        the prelogin cookie standing in for the password.
 */
struct GatewayCredential
{
  std::string username;
  std::string preloginCookie;
};

/**
 * @brief Sequences the GlobalProtect SAML login: prelogin, Okta authentication, session
 *        redirect and assertion submission.
 */
class SamlFlowController : boost::noncopyable
{
public:
  SamlFlowController(HttpTransport& transport, FactorNegotiator& negotiator);

  /**
   * @brief Ask @p gateway for its SAML request.
   * @return the identity provider URL with the SAML request in its query
   * @throw ProtocolViolation the prelogin document carries no SAMLRequest
   */
  std::string
  prelogin(const std::string& gateway);

  /**
   * @brief Log in at the identity provider that issued @p samlRequestUrl.
   * @throw ProtocolViolation the session redirect carries no SAMLResponse
   */
  SamlAssertion
  authenticate(const std::string& samlRequestUrl, const std::string& username,
               const std::string& password);

  /**
   * @brief Post @p assertion to the gateway.
   * @throw ProtocolViolation the gateway response lacks a credential header
   */
  GatewayCredential
  complete(const SamlAssertion& assertion);

  GatewayCredential
  run(const std::string& gateway, const std::string& username, const std::string& password);

public:
  static const std::string SAML_REQUEST_FIELD;
  static const std::string SAML_RESPONSE_FIELD;
  static const std::string USERNAME_HEADER;
  static const std::string COOKIE_HEADER;

private:
  HttpTransport& m_transport;
  FactorNegotiator& m_negotiator;
};

} // namespace gpokta

#endif // GPOKTA_SAML_FLOW_HPP
