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
#include "detail/url-helpers.hpp"

#include "tests/test-common.hpp"

namespace gpokta::tests {

BOOST_AUTO_TEST_SUITE(TestUrlHelpers)

BOOST_AUTO_TEST_CASE(ExtractHost)
{
  BOOST_CHECK_EQUAL(extractHost("https://example.okta.com/app/sso/saml?SAMLRequest=x"),
                    "example.okta.com");
  BOOST_CHECK_EQUAL(extractHost("https://idp.example.net:8443/sso"), "idp.example.net:8443");
  BOOST_CHECK_THROW(extractHost("not a url"), ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(EncodeForm)
{
  BOOST_CHECK_EQUAL(encodeForm({}), "");
  BOOST_CHECK_EQUAL(encodeForm({{"SAMLResponse", "a+b/c="}, {"RelayState", "x y"}}),
                    "RelayState=x%20y&SAMLResponse=a%2Bb%2Fc%3D");
}

BOOST_AUTO_TEST_CASE(AppendQuery)
{
  BOOST_CHECK_EQUAL(appendQuery("https://idp/sso", {}), "https://idp/sso");
  BOOST_CHECK_EQUAL(appendQuery("https://idp/sso", {{"a", "1"}}), "https://idp/sso?a=1");
  BOOST_CHECK_EQUAL(appendQuery("https://idp/sso?x=0", {{"a", "1"}}), "https://idp/sso?x=0&a=1");
}

BOOST_AUTO_TEST_CASE(StripQuery)
{
  BOOST_CHECK_EQUAL(stripQuery("https://idp/sso?token=secret"), "https://idp/sso");
  BOOST_CHECK_EQUAL(stripQuery("https://idp/sso#frag"), "https://idp/sso");
  BOOST_CHECK_EQUAL(stripQuery("https://idp/sso"), "https://idp/sso");
}

BOOST_AUTO_TEST_SUITE_END() // TestUrlHelpers

BOOST_AUTO_TEST_SUITE(TestJsonHelper)

BOOST_AUTO_TEST_CASE(ParseJson)
{
  auto json = parseJson(R"({"status":"MFA_REQUIRED","_embedded":{"factors":[{"factorType":"push"}]}})");
  BOOST_CHECK_EQUAL(json.get<std::string>("status"), "MFA_REQUIRED");
  BOOST_CHECK_EQUAL(json.get_child("_embedded.factors").size(), 1);

  BOOST_CHECK_THROW(parseJson("<html>"), ProtocolViolation);
  BOOST_CHECK_THROW(parseJson(""), ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(PostJson)
{
  DummyTransport transport;
  transport.respond(R"({"status":"SUCCESS"})");

  JsonSection body;
  body.put("stateToken", "st-1");
  body.put("passCode", "123456");
  auto response = postJson(transport, "https://idp/api/v1/authn", body);
  BOOST_CHECK_EQUAL(response.get<std::string>("status"), "SUCCESS");

  BOOST_REQUIRE_EQUAL(transport.requests.size(), 1);
  BOOST_CHECK_EQUAL(transport.requests[0].method, "POST");
  BOOST_CHECK_EQUAL(transport.requests[0].contentType, "application/json");
  auto sent = parseJson(transport.requests[0].body);
  BOOST_CHECK_EQUAL(sent.get<std::string>("stateToken"), "st-1");
  BOOST_CHECK_EQUAL(sent.get<std::string>("passCode"), "123456");
}

BOOST_AUTO_TEST_CASE(PostJsonHttpError)
{
  DummyTransport transport;
  transport.respond(R"({"errorCode":"E0000011"})", {}, 401);
  try {
    postJson(transport, "https://idp/api/v1/authn", JsonSection());
    BOOST_FAIL("TransportError expected");
  }
  catch (const TransportError& e) {
    BOOST_CHECK_EQUAL(e.getStatusCode(), 401);
  }
}

BOOST_AUTO_TEST_SUITE_END() // TestJsonHelper

} // namespace gpokta::tests
