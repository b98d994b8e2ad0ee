#include "EngineSettings.hpp"
#include "prosftp/RemotePath.hpp"

#include <QSettings>

static int boundedInt(const QSettings &s, const char *key, int def, int lo,
                      int hi) {
    bool ok = false;
    const int v = s.value(QLatin1String(key), def).toInt(&ok);
    if (!ok || v < lo || v > hi)
        return def;
    return v;
}

prosftp::SessionOptions
EngineSettings::sessionOptions(const QString &host, const QString &username,
                               const QString &password) const {
    prosftp::SessionOptions opt;
    opt.host = host.trimmed().toStdString();
    opt.port = static_cast<std::uint16_t>(port);
    opt.username = username.trimmed().toStdString();
    opt.password = password.toStdString();
    opt.timeout_sec = connectTimeoutSec;
    return opt;
}

EngineSettings EngineSettings::load() {
    QSettings s("ProSFTP", "ProSFTP");
    return load(s);
}

EngineSettings EngineSettings::load(QSettings &s) {
    EngineSettings e;
    e.port = boundedInt(s, "Connection/port", e.port, 1, 65535);
    e.connectTimeoutSec =
        boundedInt(s, "Connection/timeoutSec", e.connectTimeoutSec, 1, 600);
    e.commandTimeoutSec =
        boundedInt(s, "Transfer/commandTimeoutSec", e.commandTimeoutSec, 1,
                   24 * 3600);
    e.shortCommandTimeoutSec =
        boundedInt(s, "Transfer/shortCommandTimeoutSec",
                   e.shortCommandTimeoutSec, 1, 3600);
    e.logMaxLines = boundedInt(s, "Log/maxLines", e.logMaxLines, 1, 1000000);
    e.strictMkdir = s.value("Transfer/strictMkdir", e.strictMkdir).toBool();

    const QString tmp = s.value("Transfer/remoteTempDir").toString().trimmed();
    if (!tmp.isEmpty())
        e.remoteTempDir = QString::fromStdString(
            prosftp::normalizeRemote(tmp.toStdString()));
    return e;
}

void EngineSettings::save(QSettings &s) const {
    s.setValue("Connection/port", port);
    s.setValue("Connection/timeoutSec", connectTimeoutSec);
    s.setValue("Transfer/remoteTempDir", remoteTempDir);
    s.setValue("Transfer/commandTimeoutSec", commandTimeoutSec);
    s.setValue("Transfer/shortCommandTimeoutSec", shortCommandTimeoutSec);
    s.setValue("Transfer/strictMkdir", strictMkdir);
    s.setValue("Log/maxLines", logMaxLines);
}
