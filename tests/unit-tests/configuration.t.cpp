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

#include "tests/test-common.hpp"

#include <boost/program_options/parsers.hpp>

#include <fstream>

namespace gpokta::tests {

namespace po = boost::program_options;

class ConfigFixture
{
protected:
  ConfigFixture()
    : dir(getTestDir() / "config")
  {
    std::filesystem::create_directories(dir);
  }

  std::string
  writeConfig(const std::string& name, const std::string& content)
  {
    auto path = dir / name;
    std::ofstream os(path);
    os << content;
    return path.string();
  }

  static ClientConfig
  parseArgs(std::vector<const char*> args)
  {
    args.insert(args.begin(), "gp-okta");
    po::variables_map vm;
    po::store(po::command_line_parser(static_cast<int>(args.size()), args.data())
                .options(ClientConfig::makeOptionsDescription())
                .positional(ClientConfig::makePositionalDescription())
                .run(), vm);
    po::notify(vm);
    return ClientConfig::fromCommandLine(vm);
  }

protected:
  std::filesystem::path dir;
};

const std::string CONFIG = R"(
[common]
gateway = vpn.example.com
username = alice
password_cmd = echo secret
sudo = yes
openconnect-args = --servercert "pin-sha256:abc def" -v
push-poll-interval = 3
push-poll-max-attempts = 10

[factor-priority]
push = 5
sms = 3
)";

BOOST_FIXTURE_TEST_SUITE(TestConfiguration, ConfigFixture)

BOOST_AUTO_TEST_CASE(LoadFile)
{
  ClientConfig config;
  config.load(writeConfig("load.ini", CONFIG));
  BOOST_CHECK_EQUAL(config.gateway, "vpn.example.com");
  BOOST_CHECK_EQUAL(config.username.value_or(""), "alice");
  BOOST_CHECK(!config.password);
  BOOST_CHECK_EQUAL(config.passwordCommand.value_or(""), "echo secret");
  BOOST_CHECK(config.useSudo);
  std::vector<std::string> args{"--servercert", "pin-sha256:abc def", "-v"};
  BOOST_CHECK_EQUAL_COLLECTIONS(config.openconnectArgs.begin(), config.openconnectArgs.end(),
                                args.begin(), args.end());
  BOOST_CHECK(config.pushPollInterval == time::seconds(3));
  BOOST_CHECK_EQUAL(config.pushPollMaxAttempts, 10);
  BOOST_CHECK_EQUAL(config.factorPriorities.at("push"), 5);
  BOOST_CHECK_EQUAL(config.factorPriorities.at("sms"), 3);
}

BOOST_AUTO_TEST_CASE(InvalidFile)
{
  ClientConfig config;
  BOOST_CHECK_THROW(config.load((dir / "missing.ini").string()), ConfigError);
  BOOST_CHECK_THROW(config.load(writeConfig("bad-number.ini", "[factor-priority]\npush = high\n")),
                    ConfigError);
  BOOST_CHECK_THROW(config.load(writeConfig("bad-bool.ini", "[common]\nsudo = maybe\n")),
                    ConfigError);
  BOOST_CHECK_THROW(config.load(writeConfig("bad-attempts.ini", "[common]\npush-poll-max-attempts = 0\n")),
                    ConfigError);
}

BOOST_AUTO_TEST_CASE(NonPositiveLimits)
{
  ClientConfig config;
  BOOST_CHECK_THROW(config.load(writeConfig("negative-attempts.ini",
                                            "[common]\npush-poll-max-attempts = -1\n")),
                    ConfigError);
  BOOST_CHECK_THROW(config.load(writeConfig("negative-interval.ini",
                                            "[common]\npush-poll-interval = -5\n")),
                    ConfigError);
  BOOST_CHECK_THROW(config.load(writeConfig("zero-interval.ini", "[common]\npush-poll-interval = 0\n")),
                    ConfigError);
  BOOST_CHECK_THROW(config.load(writeConfig("negative-timeout.ini", "[common]\nconnect-timeout = -30\n")),
                    ConfigError);
  BOOST_CHECK_EQUAL(config.pushPollMaxAttempts, 90);
  BOOST_CHECK(config.pushPollInterval == time::seconds(2));
  BOOST_CHECK(config.connectTimeout == time::seconds(30));
}

BOOST_AUTO_TEST_CASE(CommandLineWins)
{
  auto file = writeConfig("cli.ini", CONFIG);
  auto config = parseArgs({"--config", file.data(), "--username", "bob", "--factor-priority", "push=0",
                           "--factor-priority", "webauthn=9", "--no-sudo",
                           "other.example.com", "--", "--script", "/etc/vpnc/vpnc-script"});
  BOOST_CHECK_EQUAL(config.gateway, "other.example.com");
  BOOST_CHECK_EQUAL(config.username.value_or(""), "bob");
  BOOST_CHECK_EQUAL(config.passwordCommand.value_or(""), "echo secret");
  BOOST_CHECK(!config.useSudo);
  BOOST_CHECK_EQUAL(config.factorPriorities.at("push"), 0);
  BOOST_CHECK_EQUAL(config.factorPriorities.at("sms"), 3);
  BOOST_CHECK_EQUAL(config.factorPriorities.at("webauthn"), 9);

  // command-line arguments first, then the file's
  std::vector<std::string> args{"--script", "/etc/vpnc/vpnc-script", "--servercert", "pin-sha256:abc def", "-v"};
  BOOST_CHECK_EQUAL_COLLECTIONS(config.openconnectArgs.begin(), config.openconnectArgs.end(),
                                args.begin(), args.end());
}

BOOST_AUTO_TEST_CASE(CommandLineOnly)
{
  auto config = parseArgs({"--password", "pw", "--totp-key", "GEZDGNBV", "--sudo", "vpn.example.com"});
  BOOST_CHECK_EQUAL(config.gateway, "vpn.example.com");
  BOOST_CHECK(!config.username);
  BOOST_CHECK_EQUAL(config.password.value_or(""), "pw");
  BOOST_CHECK_EQUAL(config.totpKey.value_or(""), "GEZDGNBV");
  BOOST_CHECK(config.useSudo);
  BOOST_CHECK(config.openconnectArgs.empty());
}

BOOST_AUTO_TEST_CASE(MissingGateway)
{
  BOOST_CHECK_THROW(parseArgs({"--username", "bob"}), ConfigError);
  BOOST_CHECK_THROW(parseArgs({"--factor-priority", "push", "vpn.example.com"}), ConfigError);
}

BOOST_AUTO_TEST_CASE(FactorPriority)
{
  auto priority = parseFactorPriority("token:software:totp=4");
  BOOST_CHECK_EQUAL(priority.first, "token:software:totp");
  BOOST_CHECK_EQUAL(priority.second, 4);
  BOOST_CHECK_EQUAL(parseFactorPriority("sms=-2").second, -2);

  BOOST_CHECK_THROW(parseFactorPriority("push"), ConfigError);
  BOOST_CHECK_THROW(parseFactorPriority("=1"), ConfigError);
  BOOST_CHECK_THROW(parseFactorPriority("push="), ConfigError);
  BOOST_CHECK_THROW(parseFactorPriority("push=high"), ConfigError);
}

BOOST_AUTO_TEST_CASE(EffectivePriorities)
{
  ClientConfig config;
  auto priorities = config.getEffectiveFactorPriorities();
  BOOST_CHECK_EQUAL(priorities.at("token:software:totp"), 0);
  BOOST_CHECK_EQUAL(priorities.at("push"), 1);

  config.totpKey = "GEZDGNBV";
  BOOST_CHECK_EQUAL(config.getEffectiveFactorPriorities().at("token:software:totp"), 2);

  config.factorPriorities = {{"push", 3}, {"sms", 1}};
  priorities = config.getEffectiveFactorPriorities();
  BOOST_CHECK_EQUAL(priorities.at("token:software:totp"), 2);
  BOOST_CHECK_EQUAL(priorities.at("push"), 3);
  BOOST_CHECK_EQUAL(priorities.at("sms"), 1);
}

BOOST_AUTO_TEST_CASE(VpnCommand)
{
  ClientConfig config;
  config.gateway = "vpn.example.com";
  config.openconnectArgs = {"-v"};
  std::vector<std::string> expected{"openconnect", "vpn.example.com", "--protocol=gp",
                                    "--user=alice@example.com", "--usergroup=gateway:prelogin-cookie",
                                    "--passwd-on-stdin", "-v"};
  auto command = config.makeVpnCommand("alice@example.com");
  BOOST_CHECK_EQUAL_COLLECTIONS(command.begin(), command.end(), expected.begin(), expected.end());

  config.useSudo = true;
  command = config.makeVpnCommand("alice@example.com");
  BOOST_REQUIRE_EQUAL(command.size(), expected.size() + 1);
  BOOST_CHECK_EQUAL(command[0], "sudo");
  BOOST_CHECK_EQUAL(command[1], "openconnect");
}

BOOST_AUTO_TEST_CASE(SecretCommand)
{
  BOOST_CHECK_EQUAL(runSecretCommand("echo hunter2", "Password"), "hunter2");
  BOOST_CHECK_EQUAL(runSecretCommand("printf 'first\\nsecond\\n'", "Password"), "first");
  BOOST_CHECK_THROW(runSecretCommand("echo partial; exit 3", "Password"), ConfigError);
  BOOST_CHECK_THROW(runSecretCommand("true", "TOTP"), ConfigError);
}

BOOST_AUTO_TEST_CASE(ResolveSecrets)
{
  ScriptedInteraction interaction;
  interaction.answers = {"alice"};

  ClientConfig config;
  config.password = "ignored";
  config.passwordCommand = "echo from-command";
  config.totpKeyCommand = "echo GEZDGNBVGY3TQOJQ";
  config.resolveSecrets(interaction);
  BOOST_CHECK_EQUAL(config.username.value_or(""), "alice");
  BOOST_CHECK_EQUAL(config.password.value_or(""), "from-command");
  BOOST_CHECK_EQUAL(config.totpKey.value_or(""), "GEZDGNBVGY3TQOJQ");
  BOOST_REQUIRE_EQUAL(interaction.prompts.size(), 1);
  BOOST_CHECK_EQUAL(interaction.prompts[0], "Username");
}

BOOST_AUTO_TEST_CASE(PromptForPassword)
{
  ScriptedInteraction interaction;
  interaction.answers = {"s3cret"};

  ClientConfig config;
  config.username = "alice";
  config.resolveSecrets(interaction);
  BOOST_CHECK_EQUAL(config.password.value_or(""), "s3cret");
  BOOST_CHECK_EQUAL(interaction.prompts.at(0), "Password");

  ClientConfig closed;
  BOOST_CHECK_THROW(closed.resolveSecrets(interaction), UserCancelled);
}

BOOST_AUTO_TEST_SUITE_END() // TestConfiguration

} // namespace gpokta::tests
