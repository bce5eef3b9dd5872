#include "backend_supervisor.h"

#include <QElapsedTimer>
#include <QProcessEnvironment>

#include "backend_log_relay.h"
#include "sidecar_locator.h"
#include "sidecar/probe/readiness_probe.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

#ifdef Q_OS_LINUX
#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>
#endif

namespace sidecar {

BackendSupervisor::BackendSupervisor(const SupervisorConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config) {
}

BackendSupervisor::~BackendSupervisor() {
    shutdown();
#ifdef Q_OS_WIN
    if (m_jobHandle) {
        CloseHandle(m_jobHandle);
        m_jobHandle = nullptr;
    }
#endif
}

bool BackendSupervisor::ensureBackendRunning() {
    QElapsedTimer timer;
    timer.start();

    const quint16 port = m_config.portNumber();
    if (port == 0) {
        return fail(ErrorKind::InvalidPort,
                    QString("backend: invalid port '%1'").arg(m_config.port));
    }

    // Short poll, not a single connect: a backend that is still binding its
    // port gets reuseProbeTimeoutMs to show up before a second one is spawned.
    if (ReadinessProbe::waitUntilReady(m_config.host, port, m_config.reuseProbeTimeoutMs,
                                       m_config.pollIntervalMs, m_config.connectTimeoutMs)) {
        if (m_state != State::Unchecked) {
            return true;
        }
        qInfo("backend: Reusing existing backend on %s:%d",
              qUtf8Printable(m_config.host), port);
        m_lastError = ErrorKind::None;
        m_errorString.clear();
        setState(State::Reused);
        return true;
    }

    if (m_state != State::Unchecked) {
        qWarning("backend: not reachable on %s:%d, no new launch after a finished attempt",
                 qUtf8Printable(m_config.host), port);
        return false;
    }

    setState(State::Spawning);

    QString error;
    const QString program = locateSidecar(m_config, error);
    if (program.isEmpty()) {
        return fail(ErrorKind::SidecarNotFound,
                    "backend: Failed to resolve backend sidecar: " + error);
    }

    if (!startProcess(program, error)) {
        return fail(ErrorKind::SpawnFailed,
                    "backend: Failed to spawn backend sidecar: " + error);
    }

    return waitForReady(port, timer.elapsed());
}

bool BackendSupervisor::startProcess(const QString& program, QString& error) {
    auto* proc = new QProcess(this);
    proc->setProgram(program);
    proc->setArguments({"--host", m_config.host, "--port", m_config.port});

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert("APP_VERSION", m_config.appVersion);
    env.insert("UPDATE_FEED_URL", m_config.updateFeedUrl);
    proc->setProcessEnvironment(env);

    auto relay = std::make_unique<BackendLogRelay>(m_relayLogger);
    BackendLogRelay* r = relay.get();
    connect(proc, &QProcess::readyReadStandardOutput, this, [proc, r]() {
        r->appendStdout(proc->readAllStandardOutput());
    });
    connect(proc, &QProcess::readyReadStandardError, this, [proc, r]() {
        r->appendStderr(proc->readAllStandardError());
    });
    connect(proc,
            QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this,
            [this](int exitCode, QProcess::ExitStatus status) {
                onProcessFinished(exitCode, status);
            });

    bindToShellLifetime(proc);
    proc->start();
    if (!proc->waitForStarted(kStartTimeoutMs)) {
        error = proc->errorString();
        proc->disconnect();
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            proc->waitForFinished(1000);
        }
        proc->deleteLater();
        return false;
    }

    if (!adoptIntoShellJob(proc)) {
        qWarning("backend: sidecar is not bound to the shell lifetime");
    }

    m_process = proc;
    m_relay = std::move(relay);
    ++m_spawnCount;

    qInfo("backend: started %s (pid %lld) on %s:%s",
          qUtf8Printable(program),
          static_cast<long long>(proc->processId()),
          qUtf8Printable(m_config.host),
          qUtf8Printable(m_config.port));
    return true;
}

void BackendSupervisor::bindToShellLifetime(QProcess* proc) {
#ifdef Q_OS_LINUX
    const pid_t shellPid = getpid();
    proc->setChildProcessModifier([shellPid] {
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        // The shell may have died between fork() and prctl().
        if (getppid() != shellPid) {
            _exit(1);
        }
    });
#else
    Q_UNUSED(proc);
#endif
}

bool BackendSupervisor::adoptIntoShellJob(QProcess* proc) {
#ifdef Q_OS_WIN
    if (!m_jobHandle) {
        m_jobHandle = CreateJobObjectW(NULL, NULL);
        if (!m_jobHandle) {
            qWarning("backend: CreateJobObject failed, error %lu", GetLastError());
            return false;
        }
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION info = {};
        info.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
        if (!SetInformationJobObject(m_jobHandle, JobObjectExtendedLimitInformation,
                                     &info, sizeof(info))) {
            qWarning("backend: SetInformationJobObject failed, error %lu", GetLastError());
            CloseHandle(m_jobHandle);
            m_jobHandle = nullptr;
            return false;
        }
    }

    const DWORD pid = static_cast<DWORD>(proc->processId());
    HANDLE hProc = OpenProcess(PROCESS_SET_QUOTA | PROCESS_TERMINATE, FALSE, pid);
    if (!hProc) {
        qWarning("backend: OpenProcess failed for pid %lu, error %lu", pid, GetLastError());
        return false;
    }
    const BOOL ok = AssignProcessToJobObject(m_jobHandle, hProc);
    if (!ok) {
        qWarning("backend: AssignProcessToJobObject failed for pid %lu, error %lu",
                 pid, GetLastError());
    }
    CloseHandle(hProc);
    return ok != 0;
#else
    Q_UNUSED(proc);
    return true;
#endif
}

bool BackendSupervisor::waitForReady(quint16 port, qint64 startedAtMs) {
    QElapsedTimer timer;
    timer.start();

    const bool ready = ReadinessProbe::waitUntilReady(
        m_config.host, port, m_config.readyTimeoutMs,
        m_config.pollIntervalMs, m_config.connectTimeoutMs,
        [this]() { return !ownsRunningProcess(); });

    if (ready) {
        m_readyElapsedMs = startedAtMs + timer.elapsed();
        m_lastError = ErrorKind::None;
        m_errorString.clear();
        qInfo("backend: ready on %s:%d after %lld ms",
              qUtf8Printable(m_config.host), port,
              static_cast<long long>(m_readyElapsedMs));
        setState(State::Ready);
        return true;
    }

    if (!ownsRunningProcess()) {
        return fail(ErrorKind::ExitedBeforeReady,
                    QString("backend: sidecar exited before listening on %1:%2")
                        .arg(m_config.host)
                        .arg(port));
    }

    return fail(ErrorKind::ReadyTimeout,
                QString("backend: Backend sidecar did not become ready on %1:%2 within %3 ms")
                    .arg(m_config.host)
                    .arg(port)
                    .arg(m_config.readyTimeoutMs));
}

void BackendSupervisor::onProcessFinished(int exitCode, QProcess::ExitStatus status) {
    if (status == QProcess::CrashExit) {
        qWarning("backend: process crashed (code %d)", exitCode);
    } else {
        qInfo("backend: process exited with code %d", exitCode);
    }
    releaseProcess();
    emit backendFinished(exitCode, status);
}

void BackendSupervisor::releaseProcess() {
    if (!m_process) {
        return;
    }

    if (m_relay) {
        const QByteArray tailOut = m_process->readAllStandardOutput();
        const QByteArray tailErr = m_process->readAllStandardError();
        if (!tailOut.isEmpty()) m_relay->appendStdout(tailOut);
        if (!tailErr.isEmpty()) m_relay->appendStderr(tailErr);
    }

    // Disconnect before dropping the relay so no readyRead lambda sees a dangling pointer.
    m_process->disconnect();
    m_relay.reset();

    m_process->deleteLater();
    m_process = nullptr;
}

void BackendSupervisor::shutdown(int graceTimeoutMs) {
    if (!m_process) {
        return;
    }

    QProcess* proc = m_process;
    if (proc->state() != QProcess::NotRunning) {
        qInfo("backend: stopping sidecar (pid %lld)",
              static_cast<long long>(proc->processId()));
        proc->terminate();
        if (!proc->waitForFinished(graceTimeoutMs)) {
            proc->kill();
            proc->waitForFinished(1000);
        }
    }

    // waitForFinished() normally delivers finished() synchronously.
    releaseProcess();
}

bool BackendSupervisor::ownsRunningProcess() const {
    return m_process && m_process->state() != QProcess::NotRunning;
}

qint64 BackendSupervisor::backendPid() const {
    return m_process ? m_process->processId() : 0;
}

void BackendSupervisor::setState(State state) {
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

bool BackendSupervisor::fail(ErrorKind kind, const QString& message) {
    m_lastError = kind;
    m_errorString = message;
    qWarning("%s", qUtf8Printable(message));
    setState(State::Failed);
    return false;
}

} // namespace sidecar
