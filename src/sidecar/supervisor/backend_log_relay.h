#pragma once

#include <QByteArray>
#include <memory>
#include <spdlog/spdlog.h>

#include "sidecar/sidecar_export.h"

namespace sidecar {

/**
 * Splits raw sidecar output into lines and forwards each one to a spdlog
 * logger as "backend: <line>". Partial lines are held until the next newline
 * or until the relay is flushed or destroyed.
 */
class SIDECAR_API BackendLogRelay {
public:
    explicit BackendLogRelay(std::shared_ptr<spdlog::logger> logger = nullptr);
    ~BackendLogRelay();

    BackendLogRelay(const BackendLogRelay&) = delete;
    BackendLogRelay& operator=(const BackendLogRelay&) = delete;

    void appendStdout(const QByteArray& data);
    void appendStderr(const QByteArray& data);

    /// Emits any buffered partial lines.
    void flush();

    qint64 linesRelayed() const { return m_linesRelayed; }

private:
    void processBuffer(QByteArray& buf);
    void emitLine(QByteArray line);

    std::shared_ptr<spdlog::logger> m_logger;
    QByteArray m_stdoutBuf;
    QByteArray m_stderrBuf;
    qint64 m_linesRelayed = 0;

    static constexpr qint64 kMaxBufferBytes = 1 * 1024 * 1024;  // 1MB
};

} // namespace sidecar
