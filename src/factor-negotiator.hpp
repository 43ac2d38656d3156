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

#ifndef GPOKTA_FACTOR_NEGOTIATOR_HPP
#define GPOKTA_FACTOR_NEGOTIATOR_HPP

#include "authn-response.hpp"
#include "http-transport.hpp"
#include "user-interaction.hpp"
#include "detail/totp.hpp"

#include <functional>

namespace gpokta {

class WebauthnChallenge;

enum class NegotiationState {
  INIT,
  MFA_REQUIRED,
  CHALLENGE_ISSUED,
  SUCCESS,
  LOCKED_OUT,
  FAILED,
};

std::ostream&
operator<<(std::ostream& os, NegotiationState state);

/**
 * @brief Drives the Okta primary and multi-factor authentication to a terminal status.
 */
class FactorNegotiator : boost::noncopyable
{
public:
  struct Options
  {
    /**
     * @brief Effective factor priorities, including the defaults.
     */
    FactorPriorities priorities;
    /**
     * @brief Base32 shared secret of the software TOTP factor.
     */
    optional<std::string> totpSecret;
    time::milliseconds pushPollInterval = time::seconds(2);
    size_t pushPollMaxAttempts = 90;
  };

  using Sleeper = std::function<void(time::milliseconds)>;

  /**
   * @param webauthn webauthn support, nullptr if no hardware key can be used
   * @throw ConfigError the TOTP secret is not valid base32
   */
  FactorNegotiator(HttpTransport& transport, UserInteraction& interaction,
                   Options options, WebauthnChallenge* webauthn = nullptr);

  /**
   * @brief Log in as @p username at the Okta domain @p domain.
   * @return the session token
   * @throw AccountLocked
   * @throw UnexpectedStatus
   * @throw NoSupportedFactor
   */
  std::string
  authenticate(const std::string& domain, const std::string& username, const std::string& password);

  NegotiationState
  getState() const
  {
    return m_state;
  }

  /**
   * @brief Replace the function waiting between push polls.
   */
  void
  setSleeper(Sleeper sleeper)
  {
    m_sleep = std::move(sleeper);
  }

GPOKTA_PUBLIC_WITH_TESTS_ELSE_PRIVATE:
  /**
   * @brief Try the offered factors in priority order until one yields a response.
   */
  AuthnResponse
  negotiate(const std::string& domain, const AuthnResponse& mfaRequired);

  /**
   * @throw UnsupportedFactor
   * @throw DeviceUnavailable
   */
  AuthnResponse
  verifyFactor(const std::string& domain, const Factor& factor, const AuthnResponse& current);

  std::string
  finish(const AuthnResponse& response);

private:
  AuthnResponse
  verifyPush(const Factor& factor, const AuthnResponse& current);

  AuthnResponse
  verifySms(const Factor& factor, const AuthnResponse& current);

  AuthnResponse
  verifyToken(const Factor& factor, const TokenFactor& token, const AuthnResponse& current);

  AuthnResponse
  verifyWebauthn(const std::string& domain, const AuthnResponse& current);

  AuthnResponse
  post(const std::string& url, const std::string& stateToken,
       const optional<std::string>& passCode = nullopt);

  static const std::string&
  requireVerifyUrl(const Factor& factor);

private:
  HttpTransport& m_transport;
  UserInteraction& m_interaction;
  Options m_options;
  optional<Totp> m_totp;
  WebauthnChallenge* m_webauthn;
  Sleeper m_sleep;
  NegotiationState m_state = NegotiationState::INIT;
  bool m_isWebauthnUnavailable;
};

} // namespace gpokta

#endif // GPOKTA_FACTOR_NEGOTIATOR_HPP
