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

#include "detail/form-extractor.hpp"
#include "detail/crypto-helpers.hpp"

#include "tests/test-common.hpp"

namespace gpokta::tests {

const std::string SAML_REQUEST_HTML = R"(<html>
<body onload="document.forms[0].submit()">
<form method="POST" action="https://example.okta.com/app/panw/sso/saml">
  <input type="hidden" name="SAMLRequest" value="PHNhbWxwOkF1dGhu"/>
  <input type="hidden" name="RelayState" value="rs-1"/>
  <div><input type="hidden" name="Nested" value="inside"/></div>
  <input type="hidden" name="NoValue"/>
  <input type="submit" value="unnamed"/>
</form>
<form action="https://other.example/"><input name="Second" value="x"/></form>
</body>
</html>)";

BOOST_AUTO_TEST_SUITE(TestFormExtractor)

BOOST_AUTO_TEST_CASE(FirstForm)
{
  auto form = extractForm(SAML_REQUEST_HTML);
  BOOST_CHECK_EQUAL(form.action, "https://example.okta.com/app/panw/sso/saml");
  BOOST_CHECK_EQUAL(form.fields.size(), 4);
  BOOST_CHECK(form.hasField("SAMLRequest"));
  BOOST_CHECK_EQUAL(form.fields.at("SAMLRequest"), "PHNhbWxwOkF1dGhu");
  BOOST_CHECK_EQUAL(form.fields.at("RelayState"), "rs-1");
  BOOST_CHECK_EQUAL(form.fields.at("Nested"), "inside");
  BOOST_CHECK_EQUAL(form.fields.at("NoValue"), "");
  BOOST_CHECK(!form.hasField("Second"));
}

BOOST_AUTO_TEST_CASE(SloppyMarkup)
{
  auto form = extractForm("<form action=/submit><input name=SAMLResponse value=abc><p>unclosed");
  BOOST_CHECK_EQUAL(form.action, "/submit");
  BOOST_CHECK_EQUAL(form.fields.at("SAMLResponse"), "abc");
}

BOOST_AUTO_TEST_CASE(NoForm)
{
  BOOST_CHECK_THROW(extractForm("<html><body><p>Session expired</p></body></html>"),
                    ProtocolViolation);
}

BOOST_AUTO_TEST_CASE(PreloginRequest)
{
  auto encoded = base64Encode(reinterpret_cast<const uint8_t*>(SAML_REQUEST_HTML.data()),
                              SAML_REQUEST_HTML.size());
  std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
                    "<prelogin-response><status>Success</status>"
                    "<saml-auth-method>POST</saml-auth-method>"
                    "<saml-request>" + encoded + "</saml-request>"
                    "</prelogin-response>";
  BOOST_CHECK_EQUAL(extractPreloginRequest(xml), SAML_REQUEST_HTML);
}

BOOST_AUTO_TEST_CASE(PreloginWithoutRequest)
{
  BOOST_CHECK_THROW(extractPreloginRequest("<prelogin-response><status>Success</status></prelogin-response>"),
                    ProtocolViolation);
  BOOST_CHECK_THROW(extractPreloginRequest("not xml"), ProtocolViolation);
}

BOOST_AUTO_TEST_SUITE_END() // TestFormExtractor

} // namespace gpokta::tests
