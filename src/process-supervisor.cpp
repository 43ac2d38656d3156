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

#include "process-supervisor.hpp"
#include "error.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <exception>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace gpokta {

NDN_LOG_INIT(gpokta.supervisor);

namespace {

std::atomic<pid_t> g_forwardPid{0};

void
forwardSignal(int signo)
{
  int savedErrno = errno;
  pid_t pid = g_forwardPid.load();
  if (pid > 0) {
    ::kill(pid, signo);
  }
  errno = savedErrno;
}

std::string
describeErrno(const std::string& call, int err)
{
  return call + ": " + std::strerror(err);
}

/**
 * @brief Reserves the forwarding handler for one child and designates its target.
 */
class ForwardTarget : boost::noncopyable
{
public:
  ForwardTarget()
  {
    pid_t expected = 0;
    if (!g_forwardPid.compare_exchange_strong(expected, -1)) {
      NDN_THROW(ProcessError("Another child process is already supervised"));
    }
  }

  ~ForwardTarget()
  {
    g_forwardPid.store(0);
  }

  void
  set(pid_t pid)
  {
    g_forwardPid.store(pid);
  }
};

class Pipe : boost::noncopyable
{
public:
  Pipe()
  {
    if (::pipe2(m_fds, O_CLOEXEC) != 0) {
      NDN_THROW(ProcessError(describeErrno("pipe2", errno)));
    }
  }

  ~Pipe()
  {
    closeEnd(0);
    closeEnd(1);
  }

  int
  getReadFd() const
  {
    return m_fds[0];
  }

  /**
   * @brief Hand the write end over to the caller.
   */
  int
  releaseWriteFd()
  {
    int fd = m_fds[1];
    m_fds[1] = -1;
    return fd;
  }

  void
  closeEnd(int end)
  {
    if (m_fds[end] >= 0) {
      ::close(m_fds[end]);
      m_fds[end] = -1;
    }
  }

private:
  int m_fds[2] = {-1, -1};
};

class SpawnAttributes : boost::noncopyable
{
public:
  SpawnAttributes()
  {
    int err = ::posix_spawnattr_init(&attributes);
    if (err != 0) {
      NDN_THROW(ProcessError(describeErrno("posix_spawnattr_init", err)));
    }
    err = ::posix_spawn_file_actions_init(&fileActions);
    if (err != 0) {
      ::posix_spawnattr_destroy(&attributes);
      NDN_THROW(ProcessError(describeErrno("posix_spawn_file_actions_init", err)));
    }
  }

  ~SpawnAttributes()
  {
    ::posix_spawn_file_actions_destroy(&fileActions);
    ::posix_spawnattr_destroy(&attributes);
  }

  static void
  check(int err, const char* call)
  {
    if (err != 0) {
      NDN_THROW(ProcessError(describeErrno(call, err)));
    }
  }

public:
  posix_spawnattr_t attributes;
  posix_spawn_file_actions_t fileActions;
};

} // namespace

SignalMaskGuard::SignalMaskGuard(int how, const sigset_t& set)
{
  if (::sigprocmask(how, &set, &m_previous) != 0) {
    NDN_THROW(ProcessError(describeErrno("sigprocmask", errno)));
  }
}

SignalMaskGuard::~SignalMaskGuard()
{
  ::sigprocmask(SIG_SETMASK, &m_previous, nullptr);
}

SignalHandlerGuard::SignalHandlerGuard(int signo, void (*handler)(int))
  : m_signo(signo)
{
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  if (::sigaction(signo, &action, &m_previous) != 0) {
    NDN_THROW(ProcessError(describeErrno("sigaction", errno)));
  }
}

SignalHandlerGuard::~SignalHandlerGuard()
{
  ::sigaction(m_signo, &m_previous, nullptr);
}

ChildInput::ChildInput(int fd)
  : m_fd(fd)
{
}

ChildInput::~ChildInput()
{
  close();
}

void
ChildInput::write(const std::string& data)
{
  if (m_fd < 0) {
    NDN_THROW(ProcessError("Child input is closed"));
  }

  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t n = ::write(m_fd, data.data() + offset, data.size() - offset);
    if (n >= 0) {
      offset += static_cast<size_t>(n);
    }
    else if (errno == EINTR) {
      continue;
    }
    else if (errno == EPIPE) {
      NDN_LOG_WARN("Child closed its input after " << offset << " of " << data.size() << " bytes");
      return;
    }
    else {
      NDN_THROW(ProcessError(describeErrno("write", errno)));
    }
  }
}

void
ChildInput::close()
{
  if (m_fd >= 0) {
    ::close(m_fd);
    m_fd = -1;
  }
}

ProcessSupervisor::ProcessSupervisor(int forwardedSignal)
  : m_signal(forwardedSignal)
{
}

int
ProcessSupervisor::run(const std::vector<std::string>& argv, const InputWriter& writer)
{
  if (argv.empty()) {
    NDN_THROW(ProcessError("Empty command line"));
  }

  sigset_t forwarded;
  sigemptyset(&forwarded);
  sigaddset(&forwarded, m_signal);

  std::exception_ptr writerError;
  pid_t pid = 0;
  {
    ForwardTarget target;
    SignalMaskGuard blocked(SIG_BLOCK, forwarded);

    Pipe stdinPipe;
    pid = spawn(argv, stdinPipe.getReadFd(), blocked.getPreviousMask());
    stdinPipe.closeEnd(0);
    NDN_LOG_INFO("Started " << argv.front() << " as process " << pid);

    target.set(pid);
    SignalHandlerGuard forwarder(m_signal, &forwardSignal);
    SignalHandlerGuard noSigpipe(SIGPIPE, SIG_IGN);
    SignalMaskGuard unblocked(SIG_SETMASK, blocked.getPreviousMask());

    ChildInput input(stdinPipe.releaseWriteFd());
    try {
      if (writer) {
        writer(input);
      }
    }
    catch (const std::exception&) {
      writerError = std::current_exception();
    }
    input.close();
    waitForExit(pid);
  }

  int status = reap(pid);
  NDN_LOG_INFO("Process " << pid << " exited with status " << status);
  if (writerError) {
    std::rethrow_exception(writerError);
  }
  return status;
}

pid_t
ProcessSupervisor::spawn(const std::vector<std::string>& argv, int stdinFd,
                         const sigset_t& childMask) const
{
  SpawnAttributes spawnAttrs;
  SpawnAttributes::check(::posix_spawn_file_actions_adddup2(&spawnAttrs.fileActions, stdinFd, STDIN_FILENO),
                         "posix_spawn_file_actions_adddup2");

  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, m_signal);
  sigaddset(&defaults, SIGPIPE);
  SpawnAttributes::check(::posix_spawnattr_setsigmask(&spawnAttrs.attributes, &childMask),
                         "posix_spawnattr_setsigmask");
  SpawnAttributes::check(::posix_spawnattr_setsigdefault(&spawnAttrs.attributes, &defaults),
                         "posix_spawnattr_setsigdefault");
  SpawnAttributes::check(::posix_spawnattr_setflags(&spawnAttrs.attributes,
                                                    static_cast<short>(POSIX_SPAWN_SETSIGMASK |
                                                                       POSIX_SPAWN_SETSIGDEF)),
                         "posix_spawnattr_setflags");

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.data()));
  }
  args.push_back(nullptr);

  pid_t pid = 0;
  int err = ::posix_spawnp(&pid, args.front(), &spawnAttrs.fileActions, &spawnAttrs.attributes,
                           args.data(), environ);
  if (err != 0) {
    NDN_THROW(ProcessError("Cannot run " + argv.front() + ": " + std::strerror(err)));
  }
  return pid;
}

void
ProcessSupervisor::waitForExit(pid_t pid)
{
  siginfo_t info{};
  while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
    if (errno != EINTR) {
      NDN_THROW(ProcessError(describeErrno("waitid", errno)));
    }
  }
}

int
ProcessSupervisor::reap(pid_t pid)
{
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      NDN_THROW(ProcessError(describeErrno("waitpid", errno)));
    }
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return WEXITSTATUS(status);
}

} // namespace gpokta
