#include "backend_log_relay.h"

namespace sidecar {

BackendLogRelay::BackendLogRelay(std::shared_ptr<spdlog::logger> logger)
    : m_logger(logger ? std::move(logger) : spdlog::default_logger()) {
}

BackendLogRelay::~BackendLogRelay() {
    flush();
}

void BackendLogRelay::emitLine(QByteArray line) {
    if (line.endsWith('\r')) {
        line.chop(1);
    }
    if (line.isEmpty() || !m_logger) {
        return;
    }
    m_logger->info("backend: {}", line.toStdString());
    ++m_linesRelayed;
}

void BackendLogRelay::processBuffer(QByteArray& buf) {
    while (true) {
        const int nl = buf.indexOf('\n');
        if (nl < 0) break;
        emitLine(buf.left(nl));
        buf.remove(0, nl + 1);
    }
    if (buf.size() > kMaxBufferBytes) {
        emitLine(buf);
        buf.clear();
    }
}

void BackendLogRelay::appendStdout(const QByteArray& data) {
    m_stdoutBuf.append(data);
    processBuffer(m_stdoutBuf);
}

void BackendLogRelay::appendStderr(const QByteArray& data) {
    m_stderrBuf.append(data);
    processBuffer(m_stderrBuf);
}

void BackendLogRelay::flush() {
    if (!m_stdoutBuf.isEmpty()) {
        emitLine(m_stdoutBuf);
        m_stdoutBuf.clear();
    }
    if (!m_stderrBuf.isEmpty()) {
        emitLine(m_stderrBuf);
        m_stderrBuf.clear();
    }
    if (m_logger) {
        m_logger->flush();
    }
}

} // namespace sidecar
