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

#ifndef GPOKTA_HTTP_TRANSPORT_HPP
#define GPOKTA_HTTP_TRANSPORT_HPP

#include "detail/gpokta-common.hpp"

namespace gpokta {

/**
 * @brief The final response of an HTTP exchange, after redirects were followed.
 */
struct HttpResponse
{
  /**
   * @brief Case-insensitive header lookup.
   */
  optional<std::string>
  getHeader(const std::string& name) const;

  long statusCode = 0;
  /**
   * @brief The URL the response was obtained from.
   */
  std::string effectiveUrl;
  /**
   * @brief Response headers, names in lower case.
   */
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * @brief HTTPS session shared by every step of the login sequence.
 *
 * A session keeps cookies across requests. Implementations throw TransportError when
 * the request cannot be completed or the final status is not 2xx.
 */
class HttpTransport : boost::noncopyable
{
public:
  virtual
  ~HttpTransport() = default;

  virtual HttpResponse
  get(const std::string& url) = 0;

  virtual HttpResponse
  post(const std::string& url, const std::string& body, const std::string& contentType) = 0;
};

} // namespace gpokta

#endif // GPOKTA_HTTP_TRANSPORT_HPP
