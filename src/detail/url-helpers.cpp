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

#include "detail/url-helpers.hpp"
#include "error.hpp"

#include <ndn-cxx/util/string-helper.hpp>

#include <curl/curl.h>

#include <memory>

namespace gpokta {

namespace {

struct CurlUrlDeleter
{
  void
  operator()(CURLU* handle) const
  {
    curl_url_cleanup(handle);
  }
};

std::string
getUrlPart(CURLU* handle, CURLUPart part)
{
  char* value = nullptr;
  if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || value == nullptr) {
    return "";
  }
  std::string result(value);
  curl_free(value);
  return result;
}

} // namespace

std::string
extractHost(const std::string& url)
{
  std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
  if (handle == nullptr ||
      curl_url_set(handle.get(), CURLUPART_URL, url.data(), 0) != CURLUE_OK) {
    NDN_THROW(ProtocolViolation("Cannot parse URL " + stripQuery(url)));
  }

  auto host = getUrlPart(handle.get(), CURLUPART_HOST);
  if (host.empty()) {
    NDN_THROW(ProtocolViolation("URL " + stripQuery(url) + " has no host"));
  }
  auto port = getUrlPart(handle.get(), CURLUPART_PORT);
  if (!port.empty()) {
    host += ":" + port;
  }
  return host;
}

std::string
encodeForm(const FormFields& fields)
{
  std::string encoded;
  for (const auto& [name, value] : fields) {
    if (!encoded.empty()) {
      encoded += '&';
    }
    encoded += ndn::escape(name) + '=' + ndn::escape(value);
  }
  return encoded;
}

std::string
appendQuery(const std::string& url, const FormFields& fields)
{
  if (fields.empty()) {
    return url;
  }
  auto separator = url.find('?') == std::string::npos ? '?' : '&';
  return url + separator + encodeForm(fields);
}

std::string
stripQuery(const std::string& url)
{
  return url.substr(0, url.find_first_of("?#"));
}

} // namespace gpokta
