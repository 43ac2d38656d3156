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

#ifndef GPOKTA_CURL_TRANSPORT_HPP
#define GPOKTA_CURL_TRANSPORT_HPP

#include "http-transport.hpp"

#include <memory>

#include <curl/curl.h>

namespace gpokta {

/**
 * @brief HttpTransport over a single libcurl easy handle.
 *
 * The handle keeps an in-memory cookie jar for the lifetime of the object, so the
 * tracking cookie set by the identity provider is presented on later requests.
 */
class CurlTransport : public HttpTransport
{
public:
  struct Options
  {
    time::seconds connectTimeout = time::seconds(30);
    /**
     * @brief Upper bound of a whole request, zero means no limit.
     */
    time::seconds requestTimeout = time::seconds(120);
    /**
     * @brief Allow TLS renegotiation with servers lacking RFC 5746 support.
     *
     * Many GlobalProtect gateways still need it.
     */
    bool allowLegacyRenegotiation = true;
    std::string userAgent = "gp-okta/" GPOKTA_VERSION;
  };

  explicit
  CurlTransport(const Options& options);

  ~CurlTransport() override;

  HttpResponse
  get(const std::string& url) override;

  HttpResponse
  post(const std::string& url, const std::string& body, const std::string& contentType) override;

private:
  HttpResponse
  perform(const std::string& method, const std::string& url);

  static size_t
  onBodyData(char* ptr, size_t size, size_t nmemb, void* userdata);

  static size_t
  onHeaderLine(char* ptr, size_t size, size_t nmemb, void* userdata);

  static CURLcode
  onSslContext(CURL* curl, void* sslCtx, void* userdata);

private:
  struct CurlDeleter
  {
    void
    operator()(CURL* handle) const
    {
      curl_easy_cleanup(handle);
    }
  };

  struct SlistDeleter
  {
    void
    operator()(curl_slist* list) const
    {
      curl_slist_free_all(list);
    }
  };

  std::unique_ptr<CURL, CurlDeleter> m_handle;
  char m_errorBuffer[CURL_ERROR_SIZE] = {};
};

} // namespace gpokta

#endif // GPOKTA_CURL_TRANSPORT_HPP
