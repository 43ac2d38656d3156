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

#include "console-interaction.hpp"
#include "error.hpp"

#include <iostream>

#include <termios.h>
#include <unistd.h>

namespace gpokta {

namespace {

/**
 * @brief Disables terminal echo on @p fd until destroyed.
 */
class EchoOffGuard : boost::noncopyable
{
public:
  explicit
  EchoOffGuard(int fd)
  {
    if (fd < 0 || ::isatty(fd) == 0 || ::tcgetattr(fd, &m_saved) != 0) {
      return;
    }
    termios noEcho = m_saved;
    noEcho.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (::tcsetattr(fd, TCSAFLUSH, &noEcho) == 0) {
      m_fd = fd;
    }
  }

  ~EchoOffGuard()
  {
    if (m_fd >= 0) {
      ::tcsetattr(m_fd, TCSAFLUSH, &m_saved);
    }
  }

  bool
  isActive() const
  {
    return m_fd >= 0;
  }

private:
  int m_fd = -1;
  termios m_saved{};
};

} // namespace

ConsoleInteraction::ConsoleInteraction(std::istream& input, std::ostream& output, int inputFd)
  : m_input(input)
  , m_output(output)
  , m_inputFd(inputFd)
{
}

std::string
ConsoleInteraction::readLine()
{
  std::string line;
  if (!std::getline(m_input, line)) {
    NDN_THROW(UserCancelled("Input closed while waiting for an answer"));
  }
  boost::algorithm::trim_right_if(line, boost::algorithm::is_any_of("\r"));
  return line;
}

std::string
ConsoleInteraction::readSecret(const std::string& prompt)
{
  m_output << prompt << ": " << std::flush;
  EchoOffGuard echoOff(m_inputFd);
  auto answer = readLine();
  if (echoOff.isActive()) {
    m_output << std::endl;
  }
  return answer;
}

std::string
ConsoleInteraction::promptText(const std::string& prompt)
{
  std::string answer;
  while (answer.empty()) {
    m_output << prompt << ": " << std::flush;
    answer = readLine();
  }
  return answer;
}

std::string
ConsoleInteraction::promptSecret(const std::string& prompt)
{
  std::string answer;
  while (answer.empty()) {
    answer = readSecret(prompt);
  }
  return answer;
}

bool
ConsoleInteraction::confirm(const std::string& question)
{
  m_output << question << " [y/N]: " << std::flush;
  auto answer = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(readLine()));
  return answer == "y" || answer == "yes";
}

void
ConsoleInteraction::notify(const std::string& message)
{
  m_output << message << std::endl;
}

void
ConsoleInteraction::promptPresence()
{
  notify("Touch your hardware token to confirm user presence");
}

optional<std::string>
ConsoleInteraction::requestPin(uint32_t, const std::string&)
{
  auto pin = readSecret("Enter your hardware token pin");
  if (pin.empty()) {
    return nullopt;
  }
  return pin;
}

bool
ConsoleInteraction::requestUserVerification(uint32_t, const std::string&)
{
  notify("User Verification requested.");
  return true;
}

} // namespace gpokta
