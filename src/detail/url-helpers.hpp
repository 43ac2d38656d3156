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

#ifndef GPOKTA_DETAIL_URL_HELPERS_HPP
#define GPOKTA_DETAIL_URL_HELPERS_HPP

#include "detail/gpokta-common.hpp"

namespace gpokta {

using FormFields = std::map<std::string, std::string>;

/**
 * @brief Host part of an absolute URL, with ":port" appended when the URL names one.
 * @throw ProtocolViolation @p url cannot be parsed
 */
std::string
extractHost(const std::string& url);

/**
 * @brief Percent-encode @p fields as application/x-www-form-urlencoded.
 */
std::string
encodeForm(const FormFields& fields);

/**
 * @brief Append @p fields to the query component of @p url.
 */
std::string
appendQuery(const std::string& url, const FormFields& fields);

/**
 * @brief @p url without its query and fragment, safe for diagnostics.
 */
std::string
stripQuery(const std::string& url);

} // namespace gpokta

#endif // GPOKTA_DETAIL_URL_HELPERS_HPP
