// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef LINKDECK_UNIXSIGNALHANDLER_H
#define LINKDECK_UNIXSIGNALHANDLER_H

#include <QObject>

class QSocketNotifier;

// Turns SIGINT/SIGTERM into a Qt signal on the event loop thread.
// A second signal while shutdown is still running exits immediately.
// Only one instance may exist.
class UnixSignalHandler final : public QObject {
    Q_OBJECT

public:
    explicit UnixSignalHandler(QObject* parent = nullptr);
    ~UnixSignalHandler() override;

    // False if the self-pipe or the handlers could not be installed.
    bool install(QString* errorOut = nullptr);

signals:
    void shutdownRequested(int signalNumber);

private:
    static void handleSignal(int signalNumber);
    void onReadable();

    QSocketNotifier* m_notifier = nullptr;
};

#endif //LINKDECK_UNIXSIGNALHANDLER_H
