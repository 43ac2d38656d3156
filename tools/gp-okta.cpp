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
#include "console-interaction.hpp"
#include "curl-transport.hpp"
#include "error.hpp"
#include "factor-negotiator.hpp"
#include "process-supervisor.hpp"
#include "saml-flow.hpp"
#include "webauthn-challenge.hpp"

#ifdef GPOKTA_HAVE_LIBFIDO2
#include "fido2-authenticator.hpp"
#endif

#include <boost/program_options/parsers.hpp>

#include <iostream>

#include <unistd.h>

namespace gpokta {

static void
usage(std::ostream& os, const boost::program_options::options_description& description)
{
  os << "Usage: gp-okta [options] GATEWAY [-- OPENCONNECT-ARGS...]\n"
     << "\n"
     << "Log in to a GlobalProtect gateway through Okta SAML and start openconnect.\n"
     << "\n"
     << description;
}

static std::unique_ptr<Authenticator>
makeAuthenticator(const Capabilities& capabilities)
{
  if (!capabilities.hardwareKey) {
    return nullptr;
  }
#ifdef GPOKTA_HAVE_LIBFIDO2
  return std::make_unique<Fido2Authenticator>();
#else
  return nullptr;
#endif
}

static int
main(int argc, char* argv[])
{
  namespace po = boost::program_options;
  auto description = ClientConfig::makeOptionsDescription();
  po::options_description visible("Options");
  for (const auto& option : description.options()) {
    if (option->long_name() != "gateway" && option->long_name() != "openconnect-args") {
      visible.add(option);
    }
  }

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(ClientConfig::makePositionalDescription())
                .run(), vm);
    po::notify(vm);
  }
  catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << "\n\n";
    usage(std::cerr, visible);
    return 2;
  }

  if (vm.count("help") != 0) {
    usage(std::cout, visible);
    return 0;
  }

  try {
    auto config = ClientConfig::fromCommandLine(vm);
    ConsoleInteraction console(std::cin, std::cerr, STDIN_FILENO);
    config.resolveSecrets(console);

    CurlTransport::Options transportOptions;
    transportOptions.connectTimeout = config.connectTimeout;
    CurlTransport transport(transportOptions);

    auto capabilities = Capabilities::detect();
    auto authenticator = makeAuthenticator(capabilities);
    std::unique_ptr<WebauthnChallenge> webauthn;
    if (authenticator != nullptr) {
      webauthn = std::make_unique<WebauthnChallenge>(transport, *authenticator, console, console);
    }

    FactorNegotiator::Options negotiatorOptions;
    negotiatorOptions.priorities = config.getEffectiveFactorPriorities();
    negotiatorOptions.totpSecret = config.totpKey;
    negotiatorOptions.pushPollInterval = config.pushPollInterval;
    negotiatorOptions.pushPollMaxAttempts = config.pushPollMaxAttempts;
    FactorNegotiator negotiator(transport, console, negotiatorOptions, webauthn.get());

    SamlFlowController saml(transport, negotiator);
    auto credential = saml.run(config.gateway, *config.username, *config.password);

    ProcessSupervisor supervisor;
    return supervisor.run(config.makeVpnCommand(credential.username), [&] (ChildInput& input) {
      input.write(credential.preloginCookie);
    });
  }
  catch (const UserCancelled&) {
    std::cerr << "Aborted" << std::endl;
    return 1;
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace gpokta

int
main(int argc, char* argv[])
{
  return gpokta::main(argc, argv);
}
