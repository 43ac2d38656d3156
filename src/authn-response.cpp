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

#include "authn-response.hpp"
#include "error.hpp"

#include <ostream>

namespace gpokta {

AuthnResponse::AuthnResponse(JsonSection json)
  : m_json(std::move(json))
{
  m_status = m_json.get("status", "");
  if (m_status.empty()) {
    NDN_THROW(ProtocolViolation("Authentication response carries no status"));
  }
  m_stateToken = m_json.get("stateToken", "");
  m_sessionToken = m_json.get("sessionToken", "");
  m_factorResult = m_json.get("factorResult", "");
  m_factors = parseFactors(m_json);
  auto correctAnswer = m_json.get_optional<std::string>("_embedded.factor._embedded.challenge.correctAnswer");
  if (correctAnswer && !correctAnswer->empty()) {
    m_correctAnswer = *correctAnswer;
  }
  m_challenge = m_json.get("_embedded.challenge.challenge", "");
  m_nextUrl = m_json.get("_links.next.href", "");
}

std::ostream&
operator<<(std::ostream& os, const AuthnResponse& response)
{
  os << response.getStatus();
  if (!response.getFactorResult().empty()) {
    os << " (" << response.getFactorResult() << ")";
  }
  return os;
}

} // namespace gpokta
