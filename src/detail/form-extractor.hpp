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

#ifndef GPOKTA_DETAIL_FORM_EXTRACTOR_HPP
#define GPOKTA_DETAIL_FORM_EXTRACTOR_HPP

#include "detail/url-helpers.hpp"

namespace gpokta {

/**
 * @brief Submission target and input fields of an HTML form.
 */
struct HtmlForm
{
  bool
  hasField(const std::string& name) const
  {
    return fields.count(name) > 0;
  }

  std::string action;
  FormFields fields;
};

/**
 * @brief Extract the first form of an HTML document.
 *
 * Every input element inside the form that carries a name attribute contributes a field;
 * an input without a value attribute contributes an empty value.
 *
 * @throw ProtocolViolation the document contains no form
 */
HtmlForm
extractForm(const std::string& html);

/**
 * @brief Extract the HTML document embedded in a gateway prelogin response.
 *
 * The prelogin XML carries it base64-encoded in its saml-request element.
 *
 * @throw ProtocolViolation the response is not XML or lacks a decodable saml-request element
 */
std::string
extractPreloginRequest(const std::string& xml);

} // namespace gpokta

#endif // GPOKTA_DETAIL_FORM_EXTRACTOR_HPP
