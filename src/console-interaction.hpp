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

#ifndef GPOKTA_CONSOLE_INTERACTION_HPP
#define GPOKTA_CONSOLE_INTERACTION_HPP

#include "user-interaction.hpp"

#include <iosfwd>

namespace gpokta {

/**
 * @brief Terminal implementation of both interaction interfaces.
 *
 * Prompts are written to @p output, answers read line by line from @p input. Echo is
 * turned off for secrets when @p input is attached to a terminal on file descriptor @p inputFd.
 * Text and secret prompts repeat until the answer is non-empty; an empty PIN cancels.
 */
class ConsoleInteraction : public UserInteraction, public AuthenticatorInteraction
{
public:
  ConsoleInteraction(std::istream& input, std::ostream& output, int inputFd = -1);

  std::string
  promptText(const std::string& prompt) override;

  std::string
  promptSecret(const std::string& prompt) override;

  bool
  confirm(const std::string& question) override;

  void
  notify(const std::string& message) override;

  void
  promptPresence() override;

  optional<std::string>
  requestPin(uint32_t permissions, const std::string& rpId) override;

  bool
  requestUserVerification(uint32_t permissions, const std::string& rpId) override;

private:
  std::string
  readLine();

  std::string
  readSecret(const std::string& prompt);

private:
  std::istream& m_input;
  std::ostream& m_output;
  int m_inputFd;
};

} // namespace gpokta

#endif // GPOKTA_CONSOLE_INTERACTION_HPP
