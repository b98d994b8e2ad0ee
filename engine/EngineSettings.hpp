// Tunables read from QSettings("ProSFTP", "ProSFTP"). A snapshot is taken on
// the caller's thread and copied into each job.
#pragma once
#include "prosftp/SftpTypes.hpp"

#include <QString>

class QSettings;

struct EngineSettings {
    int port = 22;
    int connectTimeoutSec = 12;
    QString remoteTempDir = QStringLiteral("/tmp");
    int commandTimeoutSec = 300;
    int shortCommandTimeoutSec = 60;
    // When true a non-zero "mkdir -p" exit fails the job before any upload.
    bool strictMkdir = true;
    int logMaxLines = 2000;

    // Connection options with the configured port and timeout filled in.
    prosftp::SessionOptions sessionOptions(const QString &host,
                                           const QString &username,
                                           const QString &password) const;

    static EngineSettings load();
    static EngineSettings load(QSettings &s);
    void save(QSettings &s) const;
};
