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

#ifndef GPOKTA_ERROR_HPP
#define GPOKTA_ERROR_HPP

#include "detail/gpokta-common.hpp"

#include <stdexcept>

namespace gpokta {

/**
 * @brief Base class of every error raised by gp-okta.
 */
class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief An HTTP request failed or returned a non-2xx status.
 */
class TransportError : public Error
{
public:
  TransportError(const std::string& what, long statusCode = 0)
    : Error(what)
    , m_statusCode(statusCode)
  {
  }

  /**
   * @return the HTTP status code, or 0 if no response was received
   */
  long
  getStatusCode() const noexcept
  {
    return m_statusCode;
  }

private:
  long m_statusCode;
};

/**
 * @brief A response lacks a field, element or form the login sequence depends on.
 */
class ProtocolViolation : public Error
{
public:
  using Error::Error;
};

/**
 * @brief The factor type is not implemented.
 */
class UnsupportedFactor : public Error
{
public:
  using Error::Error;
};

/**
 * @brief Every offered factor was tried or skipped without progress.
 */
class NoSupportedFactor : public Error
{
public:
  using Error::Error;
};

class AccountLocked : public Error
{
public:
  using Error::Error;
};

/**
 * @brief The identity provider reported a terminal status other than SUCCESS or LOCKED_OUT.
 */
class UnexpectedStatus : public Error
{
public:
  using Error::Error;
};

/**
 * @brief No usable hardware authenticator is attached.
 */
class DeviceUnavailable : public Error
{
public:
  using Error::Error;
};

class UserCancelled : public Error
{
public:
  using Error::Error;
};

class ConfigError : public Error
{
public:
  using Error::Error;
};

/**
 * @brief The VPN client could not be launched.
 */
class ProcessError : public Error
{
public:
  using Error::Error;
};

} // namespace gpokta

#endif // GPOKTA_ERROR_HPP
