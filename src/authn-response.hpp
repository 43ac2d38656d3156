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

#ifndef GPOKTA_AUTHN_RESPONSE_HPP
#define GPOKTA_AUTHN_RESPONSE_HPP

#include "factor.hpp"

namespace gpokta {

/**
 * @brief One response of the Okta authentication API.
 *
 * Each negotiation step yields a new record, a record never changes after it was parsed.
 */
class AuthnResponse
{
public:
  /**
   * @throw ProtocolViolation @p json has no status
   */
  explicit
  AuthnResponse(JsonSection json);

  const std::string&
  getStatus() const
  {
    return m_status;
  }

  const std::string&
  getStateToken() const
  {
    return m_stateToken;
  }

  /**
   * @brief sessionToken, present once the status is SUCCESS.
   */
  const std::string&
  getSessionToken() const
  {
    return m_sessionToken;
  }

  /**
   * @brief factorResult of a pending challenge, e.g. WAITING, REJECTED or TIMEOUT.
   */
  const std::string&
  getFactorResult() const
  {
    return m_factorResult;
  }

  const std::vector<Factor>&
  getFactors() const
  {
    return m_factors;
  }

  /**
   * @brief The number a push number-challenge asks the user to pick, if any.
   */
  const optional<std::string>&
  getCorrectAnswer() const
  {
    return m_correctAnswer;
  }

  /**
   * @brief _embedded.challenge.challenge of a webauthn challenge, URL-safe base64.
   */
  const std::string&
  getChallenge() const
  {
    return m_challenge;
  }

  /**
   * @brief _links.next.href, empty when absent.
   */
  const std::string&
  getNextUrl() const
  {
    return m_nextUrl;
  }

  const JsonSection&
  getJson() const
  {
    return m_json;
  }

  bool
  hasStatus(const std::string& status) const
  {
    return m_status == status;
  }

private:
  JsonSection m_json;
  std::string m_status;
  std::string m_stateToken;
  std::string m_sessionToken;
  std::string m_factorResult;
  std::vector<Factor> m_factors;
  optional<std::string> m_correctAnswer;
  std::string m_challenge;
  std::string m_nextUrl;
};

std::ostream&
operator<<(std::ostream& os, const AuthnResponse& response);

} // namespace gpokta

#endif // GPOKTA_AUTHN_RESPONSE_HPP
