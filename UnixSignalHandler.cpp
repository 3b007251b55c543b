// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "UnixSignalHandler.h"

#include <QDebug>
#include <QSocketNotifier>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/socket.h>
#include <unistd.h>

namespace {
    int g_signalFds[2] = {-1, -1};
    std::atomic<int> g_signalCount{0};

    // Conventional exit status for "killed by signal".
    constexpr int kForcedExitBase = 128;
}

UnixSignalHandler::UnixSignalHandler(QObject* parent)
    : QObject(parent) {}

UnixSignalHandler::~UnixSignalHandler() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    for (int& fd : g_signalFds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

bool UnixSignalHandler::install(QString* errorOut) {
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, g_signalFds) != 0) {
        if (errorOut) *errorOut = QStringLiteral("socketpair: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }

    m_notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, [this]() { onReadable(); });

    struct sigaction sa {};
    sa.sa_handler = &UnixSignalHandler::handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
        if (errorOut) *errorOut = QStringLiteral("sigaction: %1").arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
    return true;
}

void UnixSignalHandler::handleSignal(int signalNumber) {
    if (g_signalCount.fetch_add(1) > 0)
        ::_exit(kForcedExitBase + signalNumber);

    const char byte = static_cast<char>(signalNumber);
    // Nothing useful can be done about a failed write inside a handler.
    [[maybe_unused]] const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
}

void UnixSignalHandler::onReadable() {
    m_notifier->setEnabled(false);

    char byte = 0;
    const ssize_t n = ::read(g_signalFds[1], &byte, sizeof(byte));
    const int signalNumber = n == 1 ? static_cast<int>(byte) : 0;

    qInfo() << "Received signal" << signalNumber << "- shutting down (send again to force)";
    Q_EMIT shutdownRequested(signalNumber);
}
