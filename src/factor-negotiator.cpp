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

#include "factor-negotiator.hpp"
#include "error.hpp"
#include "json-helper.hpp"
#include "webauthn-challenge.hpp"

#include <chrono>
#include <ostream>
#include <sstream>
#include <thread>

namespace gpokta {

NDN_LOG_INIT(gpokta.negotiator);

namespace {

template<class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};

template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void
sleepFor(time::milliseconds duration)
{
  std::this_thread::sleep_for(std::chrono::milliseconds(duration.count()));
}

} // namespace

std::ostream&
operator<<(std::ostream& os, NegotiationState state)
{
  switch (state) {
    case NegotiationState::INIT:
      return os << "Init";
    case NegotiationState::MFA_REQUIRED:
      return os << "MfaRequired";
    case NegotiationState::CHALLENGE_ISSUED:
      return os << "ChallengeIssued";
    case NegotiationState::SUCCESS:
      return os << "Success";
    case NegotiationState::LOCKED_OUT:
      return os << "LockedOut";
    case NegotiationState::FAILED:
      return os << "Failed";
  }
  return os << "Unknown";
}

FactorNegotiator::FactorNegotiator(HttpTransport& transport, UserInteraction& interaction,
                                   Options options, WebauthnChallenge* webauthn)
  : m_transport(transport)
  , m_interaction(interaction)
  , m_options(std::move(options))
  , m_webauthn(webauthn)
  , m_sleep(&sleepFor)
  , m_isWebauthnUnavailable(webauthn == nullptr)
{
  if (m_options.totpSecret) {
    m_totp.emplace(*m_options.totpSecret);
  }
}

std::string
FactorNegotiator::authenticate(const std::string& domain, const std::string& username,
                               const std::string& password)
{
  m_state = NegotiationState::INIT;
  m_isWebauthnUnavailable = m_webauthn == nullptr;

  JsonSection credentials;
  credentials.put("username", username);
  credentials.put("password", password);
  NDN_LOG_INFO("Authenticating " << username << " at " << domain);
  AuthnResponse response(postJson(m_transport, "https://" + domain + "/api/v1/authn", credentials));
  NDN_LOG_DEBUG("Primary authentication: " << response);

  if (response.hasStatus(okta::STATUS_MFA_REQUIRED)) {
    m_state = NegotiationState::MFA_REQUIRED;
    return finish(negotiate(domain, response));
  }
  return finish(response);
}

AuthnResponse
FactorNegotiator::negotiate(const std::string& domain, const AuthnResponse& mfaRequired)
{
  for (const auto& factor : sortByPriority(mfaRequired.getFactors(), m_options.priorities)) {
    try {
      return verifyFactor(domain, factor, mfaRequired);
    }
    catch (const UnsupportedFactor& e) {
      NDN_LOG_DEBUG("Skipping factor " << factor << ": " << e.what());
    }
    catch (const DeviceUnavailable& e) {
      NDN_LOG_INFO("Skipping factor " << factor << ": " << e.what());
    }
  }
  m_state = NegotiationState::FAILED;
  NDN_THROW(NoSupportedFactor("No supported authentication factors"));
}

AuthnResponse
FactorNegotiator::verifyFactor(const std::string& domain, const Factor& factor,
                               const AuthnResponse& current)
{
  return std::visit(Overloaded{
    [&] (const PushFactor&) { return verifyPush(factor, current); },
    [&] (const SmsFactor&) { return verifySms(factor, current); },
    [&] (const TokenFactor& token) { return verifyToken(factor, token, current); },
    [&] (const WebauthnFactor&) { return verifyWebauthn(domain, current); },
    [&] (const UnsupportedFactorType& unsupported) -> AuthnResponse {
      NDN_THROW(UnsupportedFactor("Factor type " + unsupported.type + " is not supported"));
    },
  }, factor.kind);
}

AuthnResponse
FactorNegotiator::verifyPush(const Factor& factor, const AuthnResponse& current)
{
  const auto& url = requireVerifyUrl(factor);
  NDN_LOG_INFO("Sending push notification via " << factor.provider);
  m_state = NegotiationState::CHALLENGE_ISSUED;

  bool hasShownAnswer = false;
  AuthnResponse response = post(url, current.getStateToken());
  for (size_t attempt = 1; ; ++attempt) {
    if (!response.hasStatus(okta::STATUS_MFA_CHALLENGE) ||
        response.getFactorResult() != okta::FACTOR_RESULT_WAITING) {
      return response;
    }
    if (!hasShownAnswer && response.getCorrectAnswer()) {
      m_interaction.notify("Correct 3-number answer is: " + *response.getCorrectAnswer());
      hasShownAnswer = true;
    }
    if (attempt >= m_options.pushPollMaxAttempts) {
      break;
    }
    NDN_LOG_TRACE("Push still WAITING after poll " << attempt);
    m_sleep(m_options.pushPollInterval);
    response = post(url, response.getStateToken());
  }

  m_state = NegotiationState::FAILED;
  NDN_THROW(UnexpectedStatus("Push verification still WAITING after " +
                             std::to_string(m_options.pushPollMaxAttempts) + " polls"));
}

AuthnResponse
FactorNegotiator::verifySms(const Factor& factor, const AuthnResponse& current)
{
  const auto& url = requireVerifyUrl(factor);
  NDN_LOG_INFO("Requesting SMS code via " << factor.provider);
  m_state = NegotiationState::CHALLENGE_ISSUED;

  auto challenge = post(url, current.getStateToken());
  if (!challenge.hasStatus(okta::STATUS_MFA_CHALLENGE)) {
    m_state = NegotiationState::FAILED;
    NDN_THROW(UnexpectedStatus("SMS challenge was not issued, status " + challenge.getStatus()));
  }
  auto code = m_interaction.promptText("SMS code");
  return post(url, challenge.getStateToken(), code);
}

AuthnResponse
FactorNegotiator::verifyToken(const Factor& factor, const TokenFactor& token,
                              const AuthnResponse& current)
{
  const auto& url = requireVerifyUrl(factor);
  std::string code;
  if (token.isSoftwareTotp() && m_totp) {
    NDN_LOG_DEBUG("Computing one-time code for " << factor.provider << " locally");
    code = m_totp->now();
  }
  else {
    code = m_interaction.promptText("One-time code for " + factor.provider +
                                    " (" + factor.vendorName + ")");
  }
  m_state = NegotiationState::CHALLENGE_ISSUED;
  return post(url, current.getStateToken(), code);
}

AuthnResponse
FactorNegotiator::verifyWebauthn(const std::string& domain, const AuthnResponse& current)
{
  if (m_isWebauthnUnavailable) {
    NDN_THROW(DeviceUnavailable("No hardware authenticator"));
  }
  if (!m_webauthn->acquireDevice()) {
    m_isWebauthnUnavailable = true;
    NDN_THROW(DeviceUnavailable("No hardware authenticator attached"));
  }
  m_state = NegotiationState::CHALLENGE_ISSUED;
  return m_webauthn->verify(domain, current.getStateToken());
}

std::string
FactorNegotiator::finish(const AuthnResponse& response)
{
  NDN_LOG_DEBUG("Terminal status: " << response);
  if (response.hasStatus(okta::STATUS_SUCCESS)) {
    if (response.getSessionToken().empty()) {
      m_state = NegotiationState::FAILED;
      NDN_THROW(ProtocolViolation("SUCCESS response carries no session token"));
    }
    m_state = NegotiationState::SUCCESS;
    return response.getSessionToken();
  }
  if (response.hasStatus(okta::STATUS_LOCKED_OUT)) {
    m_state = NegotiationState::LOCKED_OUT;
    NDN_THROW(AccountLocked("Locked out of Okta"));
  }
  m_state = NegotiationState::FAILED;
  std::ostringstream os;
  os << "Unexpected authentication status " << response;
  NDN_THROW(UnexpectedStatus(os.str()));
}

AuthnResponse
FactorNegotiator::post(const std::string& url, const std::string& stateToken,
                       const optional<std::string>& passCode)
{
  JsonSection request;
  request.put("stateToken", stateToken);
  if (passCode) {
    request.put("passCode", *passCode);
  }
  return AuthnResponse(postJson(m_transport, url, request));
}

const std::string&
FactorNegotiator::requireVerifyUrl(const Factor& factor)
{
  if (factor.verifyUrl.empty()) {
    NDN_THROW(ProtocolViolation("Factor " + factor.type + " has no verify link"));
  }
  return factor.verifyUrl;
}

} // namespace gpokta
