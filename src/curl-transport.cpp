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

#include "curl-transport.hpp"
#include "detail/url-helpers.hpp"
#include "error.hpp"

#include <openssl/ssl.h>

namespace gpokta {

NDN_LOG_INIT(gpokta.http);

namespace {

class CurlGlobal : boost::noncopyable
{
public:
  CurlGlobal()
  {
    auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      NDN_THROW(TransportError("Cannot initialize libcurl: "s + curl_easy_strerror(code)));
    }
  }

  ~CurlGlobal()
  {
    curl_global_cleanup();
  }
};

} // namespace

CurlTransport::CurlTransport(const Options& options)
{
  static CurlGlobal global;

  m_handle.reset(curl_easy_init());
  if (m_handle == nullptr) {
    NDN_THROW(TransportError("Cannot create libcurl handle"));
  }

  CURL* curl = m_handle.get();
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, m_errorBuffer);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  // empty file name enables the cookie engine without reading from disk
  curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 20L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connectTimeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.requestTimeout.count()));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.data());
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlTransport::onBodyData);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlTransport::onHeaderLine);

  if (options.allowLegacyRenegotiation) {
    auto code = curl_easy_setopt(curl, CURLOPT_SSL_CTX_FUNCTION, &CurlTransport::onSslContext);
    if (code != CURLE_OK) {
      NDN_LOG_WARN("libcurl is not built with OpenSSL, legacy TLS renegotiation stays disabled: "
                   << curl_easy_strerror(code));
    }
  }
}

CurlTransport::~CurlTransport() = default;

HttpResponse
CurlTransport::get(const std::string& url)
{
  curl_easy_setopt(m_handle.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(m_handle.get(), CURLOPT_HTTPHEADER, nullptr);
  return perform("GET", url);
}

HttpResponse
CurlTransport::post(const std::string& url, const std::string& body, const std::string& contentType)
{
  std::unique_ptr<curl_slist, SlistDeleter> headers(
    curl_slist_append(nullptr, ("Content-Type: " + contentType).data()));
  if (headers == nullptr) {
    NDN_THROW(TransportError("Cannot allocate request headers"));
  }

  CURL* curl = m_handle.get();
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  auto response = perform("POST", url);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, nullptr);
  return response;
}

HttpResponse
CurlTransport::perform(const std::string& method, const std::string& url)
{
  HttpResponse response;
  CURL* curl = m_handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.data());
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
  m_errorBuffer[0] = '\0';

  NDN_LOG_DEBUG(method << " " << stripQuery(url));
  auto code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    std::string reason = m_errorBuffer[0] != '\0' ? m_errorBuffer : curl_easy_strerror(code);
    NDN_LOG_ERROR(method << " " << stripQuery(url) << " failed: " << reason);
    NDN_THROW(TransportError(method + " " + stripQuery(url) + " failed: " + reason));
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
  char* effectiveUrl = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl) == CURLE_OK && effectiveUrl != nullptr) {
    response.effectiveUrl = effectiveUrl;
  }
  NDN_LOG_DEBUG(method << " " << stripQuery(url) << " -> " << response.statusCode
                << " (" << response.body.size() << " bytes)");

  if (response.statusCode < 200 || response.statusCode >= 300) {
    NDN_THROW(TransportError("HTTP status " + std::to_string(response.statusCode) + " for " +
                             method + " " + stripQuery(url), response.statusCode));
  }
  return response;
}

size_t
CurlTransport::onBodyData(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  auto response = static_cast<HttpResponse*>(userdata);
  response->body.append(ptr, size * nmemb);
  return size * nmemb;
}

size_t
CurlTransport::onHeaderLine(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  auto response = static_cast<HttpResponse*>(userdata);
  std::string line(ptr, size * nmemb);
  boost::algorithm::trim_right(line);

  // a status line starts the headers of the next response in a redirect chain
  if (boost::algorithm::starts_with(line, "HTTP/")) {
    response->headers.clear();
    response->body.clear();
    return size * nmemb;
  }

  auto colon = line.find(':');
  if (colon != std::string::npos) {
    auto name = boost::algorithm::to_lower_copy(line.substr(0, colon));
    auto value = boost::algorithm::trim_copy(line.substr(colon + 1));
    response->headers[name] = value;
  }
  return size * nmemb;
}

CURLcode
CurlTransport::onSslContext(CURL*, void* sslCtx, void*)
{
  SSL_CTX_set_options(static_cast<SSL_CTX*>(sslCtx), SSL_OP_LEGACY_SERVER_CONNECT);
  return CURLE_OK;
}

} // namespace gpokta
