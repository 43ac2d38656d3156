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

#include "saml-flow.hpp"
#include "json-helper.hpp"
#include "detail/crypto-helpers.hpp"

#include "tests/test-common.hpp"

namespace gpokta::tests {

static std::string
makePrelogin(const std::string& html)
{
  return "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
         "<prelogin-response><status>Success</status><saml-auth-method>POST</saml-auth-method>"
         "<saml-request>" + base64Encode(reinterpret_cast<const uint8_t*>(html.data()), html.size()) +
         "</saml-request></prelogin-response>";
}

const std::string SAML_REQUEST_FORM =
  R"(<html><body><form method="POST" action="https://idp.example.com/app/panw/abc/sso/saml">)"
  R"(<input type="hidden" name="SAMLRequest" value="req+1"/>)"
  R"(<input type="hidden" name="RelayState" value="rs"/></form></body></html>)";

const std::string SAML_REQUEST_URL =
  "https://idp.example.com/app/panw/abc/sso/saml?RelayState=rs&SAMLRequest=req%2B1";

const std::string SAML_RESPONSE_FORM =
  R"(<html><body><form method="post" action="https://gw.example.com/SAML20/SP/ACS">)"
  R"(<input type="hidden" name="SAMLResponse" value="PHNhbWxwOlJlc3BvbnNl"/>)"
  R"(<input type="hidden" name="RelayState" value="rs"/></form></body></html>)";

class SamlFlowFixture
{
protected:
  SamlFlowFixture()
    : negotiator(transport, interaction, FactorNegotiator::Options{})
    , saml(transport, negotiator)
  {
  }

protected:
  DummyTransport transport;
  ScriptedInteraction interaction;
  FactorNegotiator negotiator;
  SamlFlowController saml;
};

BOOST_FIXTURE_TEST_SUITE(TestSamlFlow, SamlFlowFixture)

BOOST_AUTO_TEST_CASE(FullSequence)
{
  transport.respond(makePrelogin(SAML_REQUEST_FORM))
           .respond("<html>tracking</html>")
           .respond(R"({"status":"SUCCESS","sessionToken":"session-token"})")
           .respond(SAML_RESPONSE_FORM)
           .respond("", {{"saml-username", "alice@example.com"}, {"prelogin-cookie", "cookie-123"}});

  auto credential = saml.run("gw.example.com", "alice", "pw");
  BOOST_CHECK_EQUAL(credential.username, "alice@example.com");
  BOOST_CHECK_EQUAL(credential.preloginCookie, "cookie-123");
  BOOST_CHECK_EQUAL(transport.getRemaining(), 0);

  const auto& requests = transport.requests;
  BOOST_REQUIRE_EQUAL(requests.size(), 5);
  BOOST_CHECK_EQUAL(requests[0].method, "POST");
  BOOST_CHECK_EQUAL(requests[0].url, "https://gw.example.com/ssl-vpn/prelogin.esp");
  BOOST_CHECK_EQUAL(requests[1].method, "GET");
  BOOST_CHECK_EQUAL(requests[1].url, SAML_REQUEST_URL);
  BOOST_CHECK_EQUAL(requests[2].url, "https://idp.example.com/api/v1/authn");
  BOOST_CHECK_EQUAL(requests[3].method, "GET");
  BOOST_CHECK_EQUAL(requests[3].url,
                    "https://idp.example.com/login/sessionCookieRedirect?redirectUrl=" +
                    encodeForm({{"x", SAML_REQUEST_URL}}).substr(2) + "&token=session-token");
  BOOST_CHECK_EQUAL(requests[4].method, "POST");
  BOOST_CHECK_EQUAL(requests[4].url, "https://gw.example.com/SAML20/SP/ACS");
  BOOST_CHECK_EQUAL(requests[4].contentType, "application/x-www-form-urlencoded");
  BOOST_CHECK_EQUAL(requests[4].body, "RelayState=rs&SAMLResponse=PHNhbWxwOlJlc3BvbnNl");
}

BOOST_AUTO_TEST_CASE(PreloginWithoutSamlRequest)
{
  transport.respond(makePrelogin(R"(<form action="https://idp.example.com/"><input name="Other" value="1"/></form>)"))
           .respond("");
  BOOST_CHECK_THROW(saml.run("gw.example.com", "alice", "pw"), ProtocolViolation);
  BOOST_CHECK_EQUAL(transport.requests.size(), 1);
}

BOOST_AUTO_TEST_CASE(PreloginWithoutSaml)
{
  transport.respond("<prelogin-response><status>Success</status></prelogin-response>");
  BOOST_CHECK_THROW(saml.prelogin("gw.example.com"), ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(RedirectWithoutSamlResponse)
{
  transport.respond("")
           .respond(R"({"status":"SUCCESS","sessionToken":"session-token"})")
           .respond("<html><form action=\"https://gw.example.com/\"><input name=\"error\" value=\"1\"/></form></html>")
           .respond("");
  BOOST_CHECK_THROW(saml.authenticate(SAML_REQUEST_URL, "alice", "pw"), ProtocolViolation);
  BOOST_CHECK_EQUAL(transport.requests.size(), 3);
}

BOOST_AUTO_TEST_CASE(AuthenticationFailureStopsFlow)
{
  transport.respond("")
           .respond(R"({"status":"LOCKED_OUT"})");
  BOOST_CHECK_THROW(saml.authenticate(SAML_REQUEST_URL, "alice", "pw"), AccountLocked);
  BOOST_CHECK_EQUAL(transport.requests.size(), 2);
}

BOOST_AUTO_TEST_CASE(GatewayWithoutCookie)
{
  transport.respond("", {{"saml-username", "alice"}});
  SamlAssertion assertion{"https://gw.example.com/SAML20/SP/ACS", {{"SAMLResponse", "x"}}};
  BOOST_CHECK_THROW(saml.complete(assertion), ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(GatewayRejects)
{
  transport.respond("denied", {}, 403);
  SamlAssertion assertion{"https://gw.example.com/SAML20/SP/ACS", {{"SAMLResponse", "x"}}};
  BOOST_CHECK_THROW(saml.complete(assertion), TransportError);
}

BOOST_AUTO_TEST_SUITE_END() // TestSamlFlow

} // namespace gpokta::tests
