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

#include "factor.hpp"

#include <algorithm>
#include <ostream>

namespace gpokta {

FactorKind
makeFactorKind(const std::string& type)
{
  if (type == okta::FACTOR_PUSH) {
    return PushFactor{};
  }
  if (type == okta::FACTOR_SMS) {
    return SmsFactor{};
  }
  if (type == okta::FACTOR_WEBAUTHN) {
    return WebauthnFactor{};
  }
  if (type == okta::FACTOR_TOKEN || boost::algorithm::starts_with(type, okta::FACTOR_TOKEN + ":")) {
    return TokenFactor{type};
  }
  return UnsupportedFactorType{type};
}

std::vector<Factor>
parseFactors(const JsonSection& response)
{
  std::vector<Factor> factors;
  auto list = response.get_child_optional("_embedded.factors");
  if (!list) {
    return factors;
  }
  for (const auto& item : *list) {
    Factor factor;
    factor.type = item.second.get("factorType", "");
    factor.kind = makeFactorKind(factor.type);
    factor.provider = item.second.get("provider", "");
    factor.vendorName = item.second.get("vendorName", "");
    factor.verifyUrl = item.second.get("_links.verify.href", "");
    factor.credentialId = item.second.get("profile.credentialId", "");
    factor.position = factors.size();
    factors.push_back(std::move(factor));
  }
  return factors;
}

std::vector<Factor>
sortByPriority(std::vector<Factor> factors, const FactorPriorities& priorities)
{
  auto priority = [&priorities] (const Factor& factor) {
    auto it = priorities.find(factor.type);
    return it == priorities.end() ? 0 : it->second;
  };
  std::stable_sort(factors.begin(), factors.end(), [&] (const Factor& a, const Factor& b) {
    return priority(a) > priority(b);
  });
  return factors;
}

std::ostream&
operator<<(std::ostream& os, const Factor& factor)
{
  os << factor.type;
  if (!factor.provider.empty()) {
    os << " (" << factor.provider << ")";
  }
  return os;
}

} // namespace gpokta
