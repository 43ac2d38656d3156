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

#include "json-helper.hpp"
#include "error.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace gpokta {

JsonSection
parseJson(const std::string& text)
{
  std::istringstream is(text);
  JsonSection json;
  try {
    boost::property_tree::read_json(is, json);
  }
  catch (const boost::property_tree::json_parser_error& e) {
    NDN_THROW(ProtocolViolation("Response is not valid JSON: " + e.message() +
                                " on line " + std::to_string(e.line())));
  }
  return json;
}

std::string
toJsonString(const JsonSection& json)
{
  std::ostringstream os;
  boost::property_tree::write_json(os, json, false);
  return os.str();
}

JsonSection
postJson(HttpTransport& transport, const std::string& url, const JsonSection& body)
{
  auto response = transport.post(url, toJsonString(body), "application/json");
  return parseJson(response.body);
}

} // namespace gpokta
