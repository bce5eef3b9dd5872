#pragma once

#include <QString>

#include <functional>

#include "sidecar/sidecar_export.h"

namespace sidecar::ReadinessProbe {

constexpr int kDefaultPollIntervalMs = 120;
constexpr int kDefaultConnectTimeoutMs = 1000;

/**
 * Single TCP connect attempt to host:port.
 * Returns false on refusal, timeout, unreachable host or port 0. No retries.
 */
SIDECAR_API bool probeOnce(const QString& host, quint16 port,
                           int connectTimeoutMs = kDefaultConnectTimeoutMs);

/**
 * Probes every @p pollIntervalMs until a connect succeeds or @p timeoutMs
 * has elapsed. Pending Qt events are processed while sleeping.
 *
 * @param shouldAbort checked after each failed probe; returning true ends
 *        the wait with false.
 */
SIDECAR_API bool waitUntilReady(const QString& host, quint16 port, int timeoutMs,
                                int pollIntervalMs = kDefaultPollIntervalMs,
                                int connectTimeoutMs = kDefaultConnectTimeoutMs,
                                const std::function<bool()>& shouldAbort = {});

} // namespace sidecar::ReadinessProbe
