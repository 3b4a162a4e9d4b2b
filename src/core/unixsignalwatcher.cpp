/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
 * Copyright 2026, The CrossPlay Authors
 *
 * CrossPlay is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * CrossPlay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with CrossPlay.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <csignal>
#include <cerrno>
#include <fcntl.h>

#include <QSocketNotifier>

#include "core/logging.h"
#include "unixsignalwatcher.h"

UnixSignalWatcher *UnixSignalWatcher::sInstance = nullptr;

namespace {

bool SetNonBlocking(const int fd) {

  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;

}

}  // namespace

UnixSignalWatcher::UnixSignalWatcher(QObject *parent)
    : QObject(parent),
      signal_fd_{-1, -1},
      socket_notifier_(nullptr) {

  if (sInstance) {
    qLog(Error) << "Only one signal watcher can be installed";
    return;
  }

  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signal_fd_) != 0) {
    qLog(Error) << "Failed to create socket pair for signal handling:" << ::strerror(errno);
    signal_fd_[0] = -1;
    signal_fd_[1] = -1;
    return;
  }

  // The handler must never block, and reading stops when the socket is drained.
  for (const int fd : signal_fd_) {
    if (!SetNonBlocking(fd)) {
      qLog(Error) << "Failed to make signal socket non-blocking:" << ::strerror(errno);
    }
  }

  socket_notifier_ = new QSocketNotifier(signal_fd_[0], QSocketNotifier::Read, this);
  QObject::connect(socket_notifier_, &QSocketNotifier::activated, this, &UnixSignalWatcher::HandleSignalNotification);

  sInstance = this;

}

UnixSignalWatcher::~UnixSignalWatcher() {

  if (socket_notifier_) {
    socket_notifier_->setEnabled(false);
  }

  for (qint64 i = 0; i < watched_signals_.size(); ++i) {
    if (::sigaction(watched_signals_[i], &original_signal_actions_[i], nullptr) != 0) {
      qLog(Error) << "Failed to restore signal handler for signal" << watched_signals_[i] << ":" << ::strerror(errno);
    }
  }

  for (int &fd : signal_fd_) {
    if (fd != -1) {
      ::close(fd);
      fd = -1;
    }
  }

  if (sInstance == this) sInstance = nullptr;

}

void UnixSignalWatcher::WatchForSignal(const int signal) {

  if (signal_fd_[0] == -1 || signal_fd_[1] == -1) {
    qLog(Error) << "Cannot watch for signal" << signal << "without a socket pair";
    return;
  }

  if (watched_signals_.contains(signal)) return;

  struct sigaction signal_action{};
  ::memset(&signal_action, 0, sizeof(signal_action));
  sigemptyset(&signal_action.sa_mask);
  signal_action.sa_handler = UnixSignalWatcher::SignalHandler;
  signal_action.sa_flags = SA_RESTART;

  struct sigaction old_signal_action{};
  ::memset(&old_signal_action, 0, sizeof(old_signal_action));
  if (::sigaction(signal, &signal_action, &old_signal_action) != 0) {
    qLog(Error) << "sigaction error:" << ::strerror(errno);
    return;
  }

  watched_signals_ << signal;
  original_signal_actions_ << old_signal_action;

}

void UnixSignalWatcher::SignalHandler(const int signal) {

  if (!sInstance || sInstance->signal_fd_[1] == -1) return;

  // Only async-signal-safe calls here, a failed write cannot be reported anyway.
  (void)::write(sInstance->signal_fd_[1], &signal, sizeof(signal));

}

void UnixSignalWatcher::HandleSignalNotification() {

  Q_FOREVER {
    int signal = 0;
    const ssize_t bytes_read = ::read(signal_fd_[0], &signal, sizeof(signal));
    if (bytes_read != sizeof(signal)) break;
    qLog(Debug) << "Caught signal" << signal;
    Q_EMIT UnixSignal(signal);
  }

}
