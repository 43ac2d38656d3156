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
#include "error.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>

#include <memory>

namespace gpokta {

NDN_LOG_INIT(gpokta.form);

namespace {

template<typename Type, void (*Fn)(Type*)>
struct XmlDeleter
{
  void
  operator()(Type* obj) const
  {
    Fn(obj);
  }
};

template<typename Type, void (*Fn)(Type*)>
using ScopedXmlPtr = std::unique_ptr<Type, XmlDeleter<Type, Fn>>;

using ScopedXmlDoc = ScopedXmlPtr<xmlDoc, xmlFreeDoc>;
using ScopedXPathContext = ScopedXmlPtr<xmlXPathContext, xmlXPathFreeContext>;
using ScopedXPathObject = ScopedXmlPtr<xmlXPathObject, xmlXPathFreeObject>;

const xmlChar*
toXmlChar(const char* str)
{
  return reinterpret_cast<const xmlChar*>(str);
}

std::string
toStdString(xmlChar* str)
{
  if (str == nullptr) {
    return "";
  }
  std::string result(reinterpret_cast<const char*>(str));
  xmlFree(str);
  return result;
}

optional<std::string>
getAttribute(xmlNodePtr node, const char* name)
{
  if (xmlHasProp(node, toXmlChar(name)) == nullptr) {
    return nullopt;
  }
  return toStdString(xmlGetProp(node, toXmlChar(name)));
}

std::vector<xmlNodePtr>
selectNodes(xmlXPathContextPtr context, const char* expression, xmlNodePtr base = nullptr)
{
  ScopedXPathObject result(base == nullptr ?
                           xmlXPathEvalExpression(toXmlChar(expression), context) :
                           xmlXPathNodeEval(base, toXmlChar(expression), context));
  std::vector<xmlNodePtr> nodes;
  if (result == nullptr || result->nodesetval == nullptr) {
    return nodes;
  }
  for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
    nodes.push_back(result->nodesetval->nodeTab[i]);
  }
  return nodes;
}

} // namespace

HtmlForm
extractForm(const std::string& html)
{
  ScopedXmlDoc doc(htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, nullptr,
                                  HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                  HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
  if (doc == nullptr) {
    NDN_THROW(ProtocolViolation("Cannot parse HTML document"));
  }
  ScopedXPathContext context(xmlXPathNewContext(doc.get()));
  if (context == nullptr) {
    NDN_THROW(std::runtime_error("Cannot create XPath context"));
  }

  auto forms = selectNodes(context.get(), "//form");
  if (forms.empty()) {
    NDN_THROW(ProtocolViolation("HTML document contains no form"));
  }

  HtmlForm form;
  form.action = getAttribute(forms.front(), "action").value_or("");
  for (auto input : selectNodes(context.get(), ".//input", forms.front())) {
    auto name = getAttribute(input, "name");
    if (!name || name->empty()) {
      continue;
    }
    form.fields[*name] = getAttribute(input, "value").value_or("");
  }
  NDN_LOG_TRACE("Form targets " << stripQuery(form.action) << " with " << form.fields.size() << " fields");
  return form;
}

std::string
extractPreloginRequest(const std::string& xml)
{
  ScopedXmlDoc doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                                 XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET));
  if (doc == nullptr) {
    NDN_THROW(ProtocolViolation("Prelogin response is not an XML document"));
  }
  ScopedXPathContext context(xmlXPathNewContext(doc.get()));
  if (context == nullptr) {
    NDN_THROW(std::runtime_error("Cannot create XPath context"));
  }

  auto nodes = selectNodes(context.get(), "//saml-request");
  if (nodes.empty()) {
    NDN_THROW(ProtocolViolation("Prelogin response has no saml-request element, "
                                "is SAML authentication enabled on the gateway?"));
  }
  auto encoded = toStdString(xmlNodeGetContent(nodes.front()));
  auto decoded = base64Decode(encoded);
  return std::string(decoded.begin(), decoded.end());
}

} // namespace gpokta
