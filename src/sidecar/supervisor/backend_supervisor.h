#pragma once

#include <QObject>
#include <QProcess>
#include <QString>

#include <memory>
#include <spdlog/spdlog.h>

#include "sidecar/config/supervisor_config.h"
#include "sidecar/sidecar_export.h"

namespace sidecar {

class BackendLogRelay;

/**
 * Makes sure a backend listens on the configured port before the shell goes on.
 *
 * An already listening backend is reused. Otherwise the sidecar is spawned
 * with "--host <host> --port <port>", its output is relayed to the log, and
 * the port is polled until the ready deadline. Failures never propagate as
 * faults: they are logged and reported as false.
 *
 * State: Unchecked -> {Reused | Spawning} -> {Ready | Failed}
 * Reused, Ready and Failed are final. Later calls only repeat the reuse
 * poll and never spawn another sidecar.
 *
 * A spawned sidecar is bound to the shell's lifetime (Linux: PDEATHSIG,
 * Windows: Job Object) in addition to the regular shutdown().
 */
class SIDECAR_API BackendSupervisor : public QObject {
    Q_OBJECT
public:
    enum class State {
        Unchecked,
        Reused,
        Spawning,
        Ready,
        Failed
    };
    Q_ENUM(State)

    enum class ErrorKind {
        None,
        InvalidPort,
        SidecarNotFound,
        SpawnFailed,
        ExitedBeforeReady,
        ReadyTimeout
    };
    Q_ENUM(ErrorKind)

    explicit BackendSupervisor(const SupervisorConfig& config, QObject* parent = nullptr);
    ~BackendSupervisor() override;

    bool ensureBackendRunning();

    /// Stops a sidecar this supervisor spawned. A reused backend is left alone.
    void shutdown(int graceTimeoutMs = 3000);

    const SupervisorConfig& config() const { return m_config; }
    State state() const { return m_state; }
    ErrorKind lastError() const { return m_lastError; }
    QString errorString() const { return m_errorString; }

    int spawnCount() const { return m_spawnCount; }
    bool ownsRunningProcess() const;
    qint64 backendPid() const;
    qint64 readyElapsedMs() const { return m_readyElapsedMs; }

    /// Logger receiving relayed sidecar output; the default logger when unset.
    void setRelayLogger(std::shared_ptr<spdlog::logger> logger) { m_relayLogger = std::move(logger); }

signals:
    void stateChanged(sidecar::BackendSupervisor::State state);
    void backendFinished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    bool startProcess(const QString& program, QString& error);
    void bindToShellLifetime(QProcess* proc);
    bool adoptIntoShellJob(QProcess* proc);
    bool waitForReady(quint16 port, qint64 startedAtMs);
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void releaseProcess();
    void setState(State state);
    bool fail(ErrorKind kind, const QString& message);

    SupervisorConfig m_config;
    State m_state = State::Unchecked;
    ErrorKind m_lastError = ErrorKind::None;
    QString m_errorString;

    QProcess* m_process = nullptr;
    std::unique_ptr<BackendLogRelay> m_relay;
    std::shared_ptr<spdlog::logger> m_relayLogger;
#ifdef Q_OS_WIN
    void* m_jobHandle = nullptr;
#endif

    int m_spawnCount = 0;
    qint64 m_readyElapsedMs = -1;

    static constexpr int kStartTimeoutMs = 5000;
};

} // namespace sidecar
