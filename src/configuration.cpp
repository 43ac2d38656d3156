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

#include "configuration.hpp"
#include "error.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/property_tree/ini_parser.hpp>

#include <algorithm>
#include <array>
#include <cstdio>
#include <memory>

#include <sys/wait.h>

namespace gpokta {

NDN_LOG_INIT(gpokta.config);

namespace po = boost::program_options;

const std::string CONFIG_COMMON = "common";
const std::string CONFIG_FACTOR_PRIORITY = "factor-priority";
const std::string CONFIG_GATEWAY = "gateway";
const std::string CONFIG_USERNAME = "username";
const std::string CONFIG_PASSWORD = "password";
const std::string CONFIG_PASSWORD_CMD = "password-cmd";
const std::string CONFIG_TOTP_KEY = "totp-key";
const std::string CONFIG_TOTP_KEY_CMD = "totp-key-cmd";
const std::string CONFIG_SUDO = "sudo";
const std::string CONFIG_OPENCONNECT_ARGS = "openconnect-args";
const std::string CONFIG_CONNECT_TIMEOUT = "connect-timeout";
const std::string CONFIG_PUSH_POLL_INTERVAL = "push-poll-interval";
const std::string CONFIG_PUSH_POLL_MAX_ATTEMPTS = "push-poll-max-attempts";

namespace {

std::string
normalizeKey(std::string key)
{
  std::replace(key.begin(), key.end(), '_', '-');
  return key;
}

bool
parseBool(const std::string& key, const std::string& value, const std::string& source)
{
  auto v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
  if (v == "1" || v == "yes" || v == "true" || v == "on") {
    return true;
  }
  if (v == "0" || v == "no" || v == "false" || v == "off") {
    return false;
  }
  NDN_THROW(ConfigError(source + ": " + key + " must be a boolean, not '" + value + "'"));
}

template<typename T>
T
parseNumber(const std::string& key, const std::string& value, const std::string& source)
{
  try {
    return boost::lexical_cast<T>(boost::algorithm::trim_copy(value));
  }
  catch (const boost::bad_lexical_cast&) {
    NDN_THROW(ConfigError(source + ": " + key + " must be a number, not '" + value + "'"));
  }
}

int64_t
parsePositive(const std::string& key, const std::string& value, const std::string& source)
{
  auto number = parseNumber<int64_t>(key, value, source);
  if (number <= 0) {
    NDN_THROW(ConfigError(source + ": " + key + " must be positive, not '" + value + "'"));
  }
  return number;
}

} // namespace

Capabilities
Capabilities::detect()
{
  Capabilities capabilities;
#ifdef GPOKTA_HAVE_LIBFIDO2
  capabilities.hardwareKey = true;
#endif
  return capabilities;
}

po::options_description
ClientConfig::makeOptionsDescription()
{
  po::options_description description("Options");
  description.add_options()
    ("help,h", "produce help message")
    ("config", po::value<std::string>(), "INI configuration file")
    ("username", po::value<std::string>(), "Okta username")
    ("password", po::value<std::string>(), "Okta password")
    ("password-cmd", po::value<std::string>(), "command printing the Okta password")
    ("factor-priority", po::value<std::vector<std::string>>()->composing(),
     "priority of a factor type as TYPE=N, higher is tried first; repeatable")
    ("totp-key", po::value<std::string>(), "base32 secret of the software TOTP factor")
    ("totp-key-cmd", po::value<std::string>(), "command printing the TOTP secret")
    ("sudo", po::bool_switch(), "run openconnect through sudo")
    ("no-sudo", po::bool_switch(), "run openconnect directly")
    ("gateway", po::value<std::string>(), "GlobalProtect gateway host")
    ("openconnect-args", po::value<std::vector<std::string>>(), "arguments passed to openconnect")
    ;
  return description;
}

po::positional_options_description
ClientConfig::makePositionalDescription()
{
  po::positional_options_description positional;
  positional.add("gateway", 1);
  positional.add("openconnect-args", -1);
  return positional;
}

ClientConfig
ClientConfig::fromCommandLine(const po::variables_map& vm)
{
  ClientConfig config;
  if (vm.count("config") > 0) {
    config.load(vm["config"].as<std::string>());
  }

  auto getString = [&vm] (const std::string& name, auto& field) {
    if (vm.count(name) > 0) {
      field = vm[name].as<std::string>();
    }
  };
  getString(CONFIG_GATEWAY, config.gateway);
  getString(CONFIG_USERNAME, config.username);
  getString(CONFIG_PASSWORD, config.password);
  getString(CONFIG_PASSWORD_CMD, config.passwordCommand);
  getString(CONFIG_TOTP_KEY, config.totpKey);
  getString(CONFIG_TOTP_KEY_CMD, config.totpKeyCommand);

  if (vm.count(CONFIG_FACTOR_PRIORITY) > 0) {
    for (const auto& item : vm[CONFIG_FACTOR_PRIORITY].as<std::vector<std::string>>()) {
      auto priority = parseFactorPriority(item);
      config.factorPriorities[priority.first] = priority.second;
    }
  }

  if (vm.count("sudo") > 0 && vm["sudo"].as<bool>()) {
    config.useSudo = true;
  }
  if (vm.count("no-sudo") > 0 && vm["no-sudo"].as<bool>()) {
    config.useSudo = false;
  }

  if (vm.count(CONFIG_OPENCONNECT_ARGS) > 0) {
    auto args = vm[CONFIG_OPENCONNECT_ARGS].as<std::vector<std::string>>();
    config.openconnectArgs.insert(config.openconnectArgs.begin(), args.begin(), args.end());
  }

  if (config.gateway.empty()) {
    NDN_THROW(ConfigError("No gateway provided"));
  }
  return config;
}

void
ClientConfig::load(const std::string& fileName)
{
  JsonSection ini;
  try {
    boost::property_tree::ini_parser::read_ini(fileName, ini);
  }
  catch (const boost::property_tree::ini_parser_error& e) {
    NDN_THROW(ConfigError("Cannot read configuration file " + fileName + ": " + e.message() +
                          " (line " + std::to_string(e.line()) + ")"));
  }
  NDN_LOG_DEBUG("Loaded configuration file " << fileName);
  loadIni(ini, fileName);
}

void
ClientConfig::loadIni(const JsonSection& ini, const std::string& source)
{
  auto common = ini.get_child_optional(CONFIG_COMMON);
  if (common) {
    for (const auto& item : *common) {
      auto key = normalizeKey(item.first);
      const auto& value = item.second.data();
      if (key == CONFIG_GATEWAY) {
        gateway = value;
      }
      else if (key == CONFIG_USERNAME) {
        username = value;
      }
      else if (key == CONFIG_PASSWORD) {
        password = value;
      }
      else if (key == CONFIG_PASSWORD_CMD) {
        passwordCommand = value;
      }
      else if (key == CONFIG_TOTP_KEY) {
        totpKey = value;
      }
      else if (key == CONFIG_TOTP_KEY_CMD) {
        totpKeyCommand = value;
      }
      else if (key == CONFIG_SUDO) {
        useSudo = parseBool(key, value, source);
      }
      else if (key == CONFIG_OPENCONNECT_ARGS) {
        auto args = po::split_unix(value);
        openconnectArgs.insert(openconnectArgs.end(), args.begin(), args.end());
      }
      else if (key == CONFIG_CONNECT_TIMEOUT) {
        connectTimeout = time::seconds(parsePositive(key, value, source));
      }
      else if (key == CONFIG_PUSH_POLL_INTERVAL) {
        pushPollInterval = time::seconds(parsePositive(key, value, source));
      }
      else if (key == CONFIG_PUSH_POLL_MAX_ATTEMPTS) {
        pushPollMaxAttempts = static_cast<size_t>(parsePositive(key, value, source));
      }
      else {
        NDN_LOG_WARN(source << ": ignoring unknown key " << item.first);
      }
    }
  }

  auto priorities = ini.get_child_optional(CONFIG_FACTOR_PRIORITY);
  if (priorities) {
    for (const auto& item : *priorities) {
      factorPriorities[item.first] = parseNumber<int>(item.first, item.second.data(), source);
    }
  }
}

void
ClientConfig::resolveSecrets(UserInteraction& interaction)
{
  if (totpKeyCommand) {
    totpKey = runSecretCommand(*totpKeyCommand, "TOTP");
  }
  if (!username) {
    username = interaction.promptText("Username");
  }
  if (passwordCommand) {
    password = runSecretCommand(*passwordCommand, "Password");
  }
  if (!password) {
    password = interaction.promptSecret("Password");
  }
}

FactorPriorities
ClientConfig::getEffectiveFactorPriorities() const
{
  FactorPriorities priorities{
    {okta::FACTOR_SOFTWARE_TOTP, totpKey ? 2 : 0},
    {okta::FACTOR_PUSH, 1},
  };
  for (const auto& item : factorPriorities) {
    priorities[item.first] = item.second;
  }
  return priorities;
}

std::vector<std::string>
ClientConfig::makeVpnCommand(const std::string& samlUsername) const
{
  std::vector<std::string> command;
  if (useSudo) {
    command.push_back("sudo");
  }
  command.insert(command.end(), {
    "openconnect",
    gateway,
    "--protocol=gp",
    "--user=" + samlUsername,
    "--usergroup=gateway:prelogin-cookie",
    "--passwd-on-stdin",
  });
  command.insert(command.end(), openconnectArgs.begin(), openconnectArgs.end());
  return command;
}

std::string
runSecretCommand(const std::string& command, const std::string& label)
{
  NDN_LOG_DEBUG("Running " << label << " command");
  std::unique_ptr<FILE, decltype(&::pclose)> pipe(::popen(command.data(), "r"), &::pclose);
  if (pipe == nullptr) {
    NDN_THROW(ConfigError(label + " command could not be started"));
  }

  std::string output;
  std::array<char, 256> buffer;
  size_t n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
    output.append(buffer.data(), n);
  }
  int status = ::pclose(pipe.release());

  std::vector<std::string> lines;
  boost::algorithm::split(lines, output, boost::algorithm::is_any_of("\n"));
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0 || lines.empty()) {
    int exitStatus = status != -1 && WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    NDN_THROW(ConfigError(label + " command failed with return status " + std::to_string(exitStatus)));
  }
  if (lines.size() > 1) {
    NDN_LOG_WARN(label << " command produced more than one line of output, using the first one");
  }
  return lines.front();
}

std::pair<std::string, int>
parseFactorPriority(const std::string& text)
{
  auto pos = text.rfind('=');
  if (pos == std::string::npos || pos == 0 || pos + 1 == text.size()) {
    NDN_THROW(ConfigError("Factor priority '" + text + "' is not TYPE=N"));
  }
  auto type = text.substr(0, pos);
  return {type, parseNumber<int>(type, text.substr(pos + 1), "--factor-priority")};
}

} // namespace gpokta
