#include "readiness_probe.h"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QTcpSocket>
#include <QThread>

namespace sidecar::ReadinessProbe {

namespace {

void sleepProcessingEvents(qint64 ms) {
    QElapsedTimer timer;
    timer.start();
    while (true) {
        QCoreApplication::processEvents(QEventLoop::AllEvents);
        const qint64 left = ms - timer.elapsed();
        if (left <= 0) {
            break;
        }
        QThread::msleep(static_cast<unsigned long>(qMin<qint64>(left, 10)));
    }
}

} // namespace

bool probeOnce(const QString& host, quint16 port, int connectTimeoutMs) {
    if (port == 0 || host.isEmpty()) {
        return false;
    }

    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(qMax(1, connectTimeoutMs))) {
        socket.abort();
        return false;
    }
    socket.abort();
    return true;
}

bool waitUntilReady(const QString& host, quint16 port, int timeoutMs,
                    int pollIntervalMs, int connectTimeoutMs,
                    const std::function<bool()>& shouldAbort) {
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < timeoutMs) {
        const qint64 remaining = timeoutMs - timer.elapsed();
        const int attemptMs = static_cast<int>(qMin<qint64>(connectTimeoutMs, remaining));
        if (probeOnce(host, port, attemptMs)) {
            return true;
        }
        if (shouldAbort && shouldAbort()) {
            return false;
        }

        const qint64 left = timeoutMs - timer.elapsed();
        if (left <= 0) {
            break;
        }
        sleepProcessingEvents(qMin<qint64>(pollIntervalMs, left));
    }
    return false;
}

} // namespace sidecar::ReadinessProbe
