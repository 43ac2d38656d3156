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

#include "webauthn-challenge.hpp"
#include "error.hpp"
#include "json-helper.hpp"
#include "detail/crypto-helpers.hpp"

namespace gpokta {

NDN_LOG_INIT(gpokta.webauthn);

WebauthnChallenge::WebauthnChallenge(HttpTransport& transport, Authenticator& authenticator,
                                     UserInteraction& userInteraction,
                                     AuthenticatorInteraction& authInteraction)
  : m_transport(transport)
  , m_authenticator(authenticator)
  , m_userInteraction(userInteraction)
  , m_authInteraction(authInteraction)
{
}

bool
WebauthnChallenge::acquireDevice()
{
  while (!m_authenticator.isDeviceAvailable()) {
    m_userInteraction.notify("Please insert a suitable device if you wish to continue with webauthn MFA.");
    if (!m_userInteraction.confirm("Continue with webauthn MFA?")) {
      m_userInteraction.notify("Falling back to other MFA method.");
      return false;
    }
  }
  NDN_LOG_DEBUG("Hardware authenticator found");
  return true;
}

std::string
WebauthnChallenge::getVerifyUrl(const std::string& domain)
{
  return "https://" + domain + "/api/v1/authn/factors/webauthn/verify";
}

std::string
WebauthnChallenge::toTransportEncoding(const std::string& websafe)
{
  return base64Encode(websafeBase64Decode(websafe));
}

AssertionRequest
WebauthnChallenge::makeAssertionRequest(const std::string& domain, const AuthnResponse& challenge)
{
  if (challenge.getChallenge().empty()) {
    NDN_THROW(ProtocolViolation("Webauthn challenge response carries no challenge"));
  }

  AssertionRequest request;
  request.origin = "https://" + domain;
  request.rpId = domain;
  request.challenge = websafeBase64Decode(challenge.getChallenge());
  for (const auto& factor : challenge.getFactors()) {
    if (factor.credentialId.empty()) {
      NDN_LOG_WARN("Webauthn factor #" << factor.position << " has no credential id");
      continue;
    }
    request.allowCredentials.push_back(websafeBase64Decode(factor.credentialId));
  }
  NDN_LOG_DEBUG("Allowing " << request.allowCredentials.size() << " credential(s) for " << domain);
  return request;
}

AuthnResponse
WebauthnChallenge::verify(const std::string& domain, const std::string& stateToken)
{
  JsonSection challengeRequest;
  challengeRequest.put("stateToken", stateToken);
  AuthnResponse challenge(postJson(m_transport, getVerifyUrl(domain), challengeRequest));
  if (!challenge.hasStatus(okta::STATUS_MFA_CHALLENGE)) {
    NDN_THROW(UnexpectedStatus("Webauthn challenge was not issued, status " + challenge.getStatus()));
  }
  if (challenge.getNextUrl().empty()) {
    NDN_THROW(ProtocolViolation("Webauthn challenge response carries no next link"));
  }

  auto assertion = m_authenticator.getAssertion(makeAssertionRequest(domain, challenge),
                                                m_authInteraction);

  // the challenge's state token supersedes the one the challenge was requested with
  JsonSection payload;
  payload.put("authenticatorData", toTransportEncoding(assertion.authenticatorData));
  payload.put("clientData", toTransportEncoding(assertion.clientData));
  payload.put("signatureData", toTransportEncoding(assertion.signature));
  payload.put("stateToken", challenge.getStateToken());
  return AuthnResponse(postJson(m_transport, challenge.getNextUrl(), payload));
}

} // namespace gpokta
