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

#ifndef GPOKTA_FACTOR_HPP
#define GPOKTA_FACTOR_HPP

#include "detail/gpokta-common.hpp"

#include <variant>

namespace gpokta {

struct PushFactor
{
};

struct SmsFactor
{
};

/**
 * @brief A factor of the one-time code family ("token" or "token:*").
 */
struct TokenFactor
{
  bool
  isSoftwareTotp() const
  {
    return type == okta::FACTOR_SOFTWARE_TOTP;
  }

  std::string type;
};

struct WebauthnFactor
{
};

struct UnsupportedFactorType
{
  std::string type;
};

using FactorKind = std::variant<PushFactor, SmsFactor, TokenFactor, WebauthnFactor, UnsupportedFactorType>;

/**
 * @brief Map a factorType tag of the Okta API to its kind.
 */
FactorKind
makeFactorKind(const std::string& type);

/**
 * @brief One authentication method offered by the identity provider.
 */
struct Factor
{
  FactorKind kind;
  /**
   * @brief The factorType tag as sent by the provider.
   */
  std::string type;
  std::string provider;
  std::string vendorName;
  /**
   * @brief _links.verify.href, empty when absent.
   */
  std::string verifyUrl;
  /**
   * @brief profile.credentialId of webauthn factors.
   */
  std::string credentialId;
  /**
   * @brief Index in the provider's list, the tie breaker of priority ordering.
   */
  size_t position = 0;
};

/**
 * @brief Parse the _embedded.factors list of an authentication response.
 *
 * @return the factors in provider order; empty if the list is absent
 */
std::vector<Factor>
parseFactors(const JsonSection& response);

/**
 * @brief Order factors for negotiation.
 *
 * Stable sort, descending by the priority of each factor's type tag. Types missing from
 * @p priorities rank 0, equal priorities keep the provider's order.
 */
std::vector<Factor>
sortByPriority(std::vector<Factor> factors, const FactorPriorities& priorities);

std::ostream&
operator<<(std::ostream& os, const Factor& factor);

} // namespace gpokta

#endif // GPOKTA_FACTOR_HPP
