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

#ifndef GPOKTA_CONFIGURATION_HPP
#define GPOKTA_CONFIGURATION_HPP

#include "user-interaction.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

namespace gpokta {

/**
 * @brief Optional features available in this build, detected once at startup.
 */
struct Capabilities
{
  static Capabilities
  detect();

  /**
   * @brief Whether webauthn factors can be answered with a FIDO2 hardware key.
   */
  bool hardwareKey = false;
};

/**
 * @brief Settings of one gp-okta run, from the command line and an optional INI file.
 *
 * The file has a [common] section with the keys of the long command-line options and a
 * [factor-priority] section mapping factor types to priorities. Command-line values win.
 */
class ClientConfig
{
public:
  static boost::program_options::options_description
  makeOptionsDescription();

  static boost::program_options::positional_options_description
  makePositionalDescription();

  /**
   * @brief Build the configuration of parsed command-line options, loading --config first.
   * @throw ConfigError the file is invalid, an option is malformed or no gateway was given
   */
  static ClientConfig
  fromCommandLine(const boost::program_options::variables_map& vm);

  /**
   * @brief Load an INI configuration file.
   * @throw ConfigError
   */
  void
  load(const std::string& fileName);

  /**
   * @brief Load an already parsed INI document; @p source names it in errors.
   */
  void
  loadIni(const JsonSection& ini, const std::string& source);

  /**
   * @brief Run the secret commands and prompt for the username and password if still unknown.
   * @throw ConfigError a secret command failed
   */
  void
  resolveSecrets(UserInteraction& interaction);

  /**
   * @brief Factor priorities after applying the defaults.
   *
   * token:software:totp ranks 2 when a TOTP key is configured and 0 otherwise, push ranks 1,
   * configured priorities replace the defaults.
   */
  FactorPriorities
  getEffectiveFactorPriorities() const;

  /**
   * @brief The VPN client command line for the gateway user @p samlUsername.
   */
  std::vector<std::string>
  makeVpnCommand(const std::string& samlUsername) const;

public:
  std::string gateway;
  optional<std::string> username;
  optional<std::string> password;
  optional<std::string> passwordCommand;
  optional<std::string> totpKey;
  optional<std::string> totpKeyCommand;
  FactorPriorities factorPriorities;
  bool useSudo = false;
  std::vector<std::string> openconnectArgs;
  time::seconds connectTimeout = time::seconds(30);
  time::seconds pushPollInterval = time::seconds(2);
  size_t pushPollMaxAttempts = 90;
};

/**
 * @brief Run @p command through the shell and return the first line of its output.
 * @param label names the secret in messages
 * @throw ConfigError the command failed or printed nothing
 */
std::string
runSecretCommand(const std::string& command, const std::string& label);

/**
 * @brief Parse a TYPE=N factor priority.
 * @throw ConfigError
 */
std::pair<std::string, int>
parseFactorPriority(const std::string& text);

} // namespace gpokta

#endif // GPOKTA_CONFIGURATION_HPP
