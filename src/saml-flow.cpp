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

#include "saml-flow.hpp"
#include "error.hpp"
#include "detail/form-extractor.hpp"

namespace gpokta {

NDN_LOG_INIT(gpokta.saml);

const std::string SamlFlowController::SAML_REQUEST_FIELD = "SAMLRequest";
const std::string SamlFlowController::SAML_RESPONSE_FIELD = "SAMLResponse";
const std::string SamlFlowController::USERNAME_HEADER = "saml-username";
const std::string SamlFlowController::COOKIE_HEADER = "prelogin-cookie";

SamlFlowController::SamlFlowController(HttpTransport& transport, FactorNegotiator& negotiator)
  : m_transport(transport)
  , m_negotiator(negotiator)
{
}

std::string
SamlFlowController::prelogin(const std::string& gateway)
{
  NDN_LOG_INFO("Prelogin at " << gateway);
  auto response = m_transport.post("https://" + gateway + "/ssl-vpn/prelogin.esp", "",
                                   "application/x-www-form-urlencoded");
  auto form = extractForm(extractPreloginRequest(response.body));
  if (!form.hasField(SAML_REQUEST_FIELD)) {
    NDN_THROW(ProtocolViolation("Prelogin form carries no " + SAML_REQUEST_FIELD));
  }
  NDN_LOG_DEBUG("SAML request goes to " << form.action);
  return appendQuery(form.action, form.fields);
}

SamlAssertion
SamlFlowController::authenticate(const std::string& samlRequestUrl, const std::string& username,
                                 const std::string& password)
{
  auto domain = extractHost(samlRequestUrl);

  // sets the provider's device tracking cookie
  m_transport.get(samlRequestUrl);

  auto sessionToken = m_negotiator.authenticate(domain, username, password);

  auto response = m_transport.get(appendQuery("https://" + domain + "/login/sessionCookieRedirect",
                                              {{"token", sessionToken},
                                               {"redirectUrl", samlRequestUrl}}));
  auto form = extractForm(response.body);
  if (!form.hasField(SAML_RESPONSE_FIELD)) {
    NDN_THROW(ProtocolViolation("Session redirect form carries no " + SAML_RESPONSE_FIELD));
  }
  return {form.action, form.fields};
}

GatewayCredential
SamlFlowController::complete(const SamlAssertion& assertion)
{
  NDN_LOG_INFO("Submitting SAML response to " << stripQuery(assertion.url));
  auto response = m_transport.post(assertion.url, encodeForm(assertion.fields),
                                   "application/x-www-form-urlencoded");
  auto username = response.getHeader(USERNAME_HEADER);
  auto cookie = response.getHeader(COOKIE_HEADER);
  if (!username || !cookie) {
    NDN_THROW(ProtocolViolation("Gateway response lacks the " + USERNAME_HEADER + " or " +
                                COOKIE_HEADER + " header"));
  }
  NDN_LOG_INFO("Gateway accepted SAML login of " << *username);
  return {*username, *cookie};
}

GatewayCredential
SamlFlowController::run(const std::string& gateway, const std::string& username,
                        const std::string& password)
{
  auto samlRequestUrl = prelogin(gateway);
  auto assertion = authenticate(samlRequestUrl, username, password);
  return complete(assertion);
}

} // namespace gpokta
