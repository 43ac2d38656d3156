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

#ifndef GPOKTA_USER_INTERACTION_HPP
#define GPOKTA_USER_INTERACTION_HPP

#include "detail/gpokta-common.hpp"

namespace gpokta {

/**
 * @brief Prompts and notices addressed to the person logging in.
 */
class UserInteraction : boost::noncopyable
{
public:
  virtual
  ~UserInteraction() = default;

  /**
   * @throw UserCancelled the input was closed
   */
  virtual std::string
  promptText(const std::string& prompt) = 0;

  /**
   * @brief Like promptText, without echoing the answer.
   */
  virtual std::string
  promptSecret(const std::string& prompt) = 0;

  /**
   * @return true if the user agreed; the default answer is no
   */
  virtual bool
  confirm(const std::string& question) = 0;

  virtual void
  notify(const std::string& message) = 0;
};

/**
 * @brief Callbacks of a hardware authenticator waiting for the user.
 */
class AuthenticatorInteraction : boost::noncopyable
{
public:
  virtual
  ~AuthenticatorInteraction() = default;

  /**
   * @brief The authenticator awaits a user presence check (a touch).
   */
  virtual void
  promptPresence() = 0;

  /**
   * @return the PIN, or nullopt to cancel
   */
  virtual optional<std::string>
  requestPin(uint32_t permissions, const std::string& rpId) = 0;

  /**
   * @return true to allow built-in user verification, false to cancel
   */
  virtual bool
  requestUserVerification(uint32_t permissions, const std::string& rpId) = 0;
};

} // namespace gpokta

#endif // GPOKTA_USER_INTERACTION_HPP
