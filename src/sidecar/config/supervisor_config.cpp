#include "supervisor_config.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

namespace sidecar {

namespace {

bool isValidLogLevel(const QString& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool readString(const QJsonObject& obj, const QString& key, QString& out, QString& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.value(key).isString()) {
        error = "config field '" + key + "' must be a string";
        return false;
    }
    out = obj.value(key).toString();
    if (out.isEmpty()) {
        error = "config field '" + key + "' cannot be empty";
        return false;
    }
    return true;
}

} // namespace

SupervisorConfig SupervisorConfig::loadFromFile(const QString& filePath, QString& error) {
    SupervisorConfig cfg;

    if (!QFileInfo::exists(filePath)) {
        error.clear();
        return cfg;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open config file: " + filePath;
        return cfg;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "config parse error: " + parseErr.errorString();
        return cfg;
    }
    if (!doc.isObject()) {
        error = "config must contain a JSON object";
        return cfg;
    }

    const QJsonObject obj = doc.object();
    static const QSet<QString> known = {
        "port", "updateFeedUrl", "sidecarProgram", "readyTimeoutMs", "logLevel", "logDir"};
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in config: " + it.key();
            return cfg;
        }
    }

    if (obj.contains("port")) {
        if (!obj.value("port").isDouble()) {
            error = "config field 'port' must be an integer";
            return cfg;
        }
        const int port = obj.value("port").toInt();
        if (port < 1 || port > 65535) {
            error = "config field 'port' out of range";
            return cfg;
        }
        cfg.port = QString::number(port);
    }

    if (!readString(obj, "updateFeedUrl", cfg.updateFeedUrl, error)
        || !readString(obj, "sidecarProgram", cfg.sidecarProgram, error)
        || !readString(obj, "logDir", cfg.logDir, error)) {
        return cfg;
    }

    if (obj.contains("readyTimeoutMs")) {
        if (!obj.value("readyTimeoutMs").isDouble()) {
            error = "config field 'readyTimeoutMs' must be an integer";
            return cfg;
        }
        cfg.readyTimeoutMs = obj.value("readyTimeoutMs").toInt();
        if (cfg.readyTimeoutMs <= 0) {
            error = "config field 'readyTimeoutMs' must be positive";
            return cfg;
        }
    }

    if (readString(obj, "logLevel", cfg.logLevel, error)) {
        if (!isValidLogLevel(cfg.logLevel)) {
            error = "invalid config logLevel: " + cfg.logLevel;
            return cfg;
        }
    } else {
        return cfg;
    }

    error.clear();
    return cfg;
}

void SupervisorConfig::applyEnvironment(const QProcessEnvironment& env) {
    const QString envPort = env.value("APP_PORT");
    if (!envPort.isEmpty()) {
        port = envPort;
    }
    const QString envFeed = env.value("UPDATE_FEED_URL");
    if (!envFeed.isEmpty()) {
        updateFeedUrl = envFeed;
    }
}

void SupervisorConfig::applyArgs(const ShellArgs& args) {
    if (args.hasPort) {
        port = args.port;
    }
    if (args.hasSidecarProgram) {
        sidecarProgram = args.sidecarProgram;
    }
    if (args.hasUpdateFeedUrl) {
        updateFeedUrl = args.updateFeedUrl;
    }
    if (args.hasReadyTimeout) {
        readyTimeoutMs = args.readyTimeoutMs;
    }
    if (args.hasLogLevel) {
        logLevel = args.logLevel;
    }
    if (args.hasLogDir) {
        logDir = args.logDir;
    }
}

quint16 SupervisorConfig::portNumber() const {
    bool ok = false;
    const int value = port.trimmed().toInt(&ok);
    if (!ok || value < 1 || value > 65535) {
        return 0;
    }
    return static_cast<quint16>(value);
}

} // namespace sidecar
