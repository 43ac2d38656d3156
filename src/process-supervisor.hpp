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

#ifndef GPOKTA_PROCESS_SUPERVISOR_HPP
#define GPOKTA_PROCESS_SUPERVISOR_HPP

#include "detail/gpokta-common.hpp"

#include <functional>

#include <signal.h>
#include <sys/types.h>

namespace gpokta {

/**
 * @brief Changes the process signal mask, restoring the previous mask on destruction.
 */
class SignalMaskGuard : boost::noncopyable
{
public:
  /**
   * @param how SIG_BLOCK, SIG_UNBLOCK or SIG_SETMASK
   * @throw ProcessError sigprocmask failed
   */
  SignalMaskGuard(int how, const sigset_t& set);

  ~SignalMaskGuard();

  /**
   * @brief The mask in effect before this guard.
   */
  const sigset_t&
  getPreviousMask() const
  {
    return m_previous;
  }

private:
  sigset_t m_previous;
};

/**
 * @brief Installs a signal disposition, restoring the previous one on destruction.
 */
class SignalHandlerGuard : boost::noncopyable
{
public:
  /**
   * @throw ProcessError sigaction failed
   */
  SignalHandlerGuard(int signo, void (*handler)(int));

  ~SignalHandlerGuard();

private:
  int m_signo;
  struct sigaction m_previous;
};

/**
 * @brief Write end of the child's standard input, lent to the caller of ProcessSupervisor::run.
 */
class ChildInput : boost::noncopyable
{
public:
  ~ChildInput();

  /**
   * @brief Write all of @p data.
   *
   * If the child has already closed its input, the rest of @p data is dropped with a warning;
   * the child's exit status tells the outcome.
   *
   * @throw ProcessError the write failed for another reason or the input was closed
   */
  void
  write(const std::string& data);

  bool
  isOpen() const
  {
    return m_fd >= 0;
  }

private:
  explicit
  ChildInput(int fd);

  void
  close();

private:
  int m_fd;

  friend class ProcessSupervisor;
};

/**
 * @brief Runs a child process, forwarding a termination signal to it exactly once.
 *
 * The signal is blocked before the child is spawned and the forwarding handler is live
 * before it is unblocked, so a signal arriving at any point of the child's life reaches it.
 * Only one child can be supervised at a time.
 */
class ProcessSupervisor : boost::noncopyable
{
public:
  using InputWriter = std::function<void(ChildInput&)>;

  explicit
  ProcessSupervisor(int forwardedSignal = SIGTERM);

  /**
   * @brief Spawn @p argv (searched in PATH) and wait for it to exit.
   *
   * @p writer is called with the child's standard input, which is closed when the writer
   * returns. If @p writer throws, the input is closed and the child reaped before the
   * exception propagates.
   *
   * @return the child's exit status, or 128 plus the signal number if a signal killed it
   * @throw ProcessError the child could not be spawned or awaited
   */
  int
  run(const std::vector<std::string>& argv, const InputWriter& writer = nullptr);

private:
  pid_t
  spawn(const std::vector<std::string>& argv, int stdinFd, const sigset_t& childMask) const;

  static void
  waitForExit(pid_t pid);

  static int
  reap(pid_t pid);

private:
  int m_signal;
};

} // namespace gpokta

#endif // GPOKTA_PROCESS_SUPERVISOR_HPP
