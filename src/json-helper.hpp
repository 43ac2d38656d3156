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

#ifndef GPOKTA_JSON_HELPER_HPP
#define GPOKTA_JSON_HELPER_HPP

#include "http-transport.hpp"

namespace gpokta {

/**
 * @throw ProtocolViolation @p text is not a JSON document
 */
JsonSection
parseJson(const std::string& text);

std::string
toJsonString(const JsonSection& json);

/**
 * @brief POST @p body as application/json and parse the JSON response.
 *
 * @throw TransportError non-2xx status or transport failure
 * @throw ProtocolViolation the response is not JSON
 */
JsonSection
postJson(HttpTransport& transport, const std::string& url, const JsonSection& body);

} // namespace gpokta

#endif // GPOKTA_JSON_HELPER_HPP
