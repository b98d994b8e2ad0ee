#include "Archiver.hpp"

#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <utility>

TarProcessArchiver::TarProcessArchiver(QString program, int timeoutMs)
    : program_(std::move(program)), timeoutMs_(timeoutMs) {}

bool TarProcessArchiver::run(const QStringList &args, prosftp::Error &err) {
    QProcess p;
    p.start(program_, args);
    if (!p.waitForStarted()) {
        err.set(prosftp::ErrorCode::LocalIOFailed,
                "Could not start " + program_.toStdString() + ": " +
                    p.errorString().toStdString());
        return false;
    }
    if (!p.waitForFinished(timeoutMs_)) {
        p.kill();
        p.waitForFinished();
        err.set(prosftp::ErrorCode::LocalIOFailed, "tar timed out");
        return false;
    }
    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) {
        QString msg = QString::fromLocal8Bit(p.readAllStandardError()).trimmed();
        if (msg.isEmpty())
            msg = QString::fromLocal8Bit(p.readAllStandardOutput()).trimmed();
        if (msg.isEmpty())
            msg = QStringLiteral("tar exited with code %1").arg(p.exitCode());
        err.set(prosftp::ErrorCode::LocalIOFailed, msg.toStdString());
        return false;
    }
    return true;
}

bool TarProcessArchiver::createTarGz(const QString &folder,
                                     const QString &archivePath,
                                     prosftp::Error &err) {
    const QFileInfo fi(QDir(folder).absolutePath());
    if (!fi.isDir()) {
        err.set(prosftp::ErrorCode::LocalIOFailed,
                "Not a folder: " + folder.toStdString());
        return false;
    }
    return run({"-czf", archivePath, "-C", fi.absolutePath(), fi.fileName()},
               err);
}

bool TarProcessArchiver::extractTarGz(const QString &archivePath,
                                      const QString &destDir,
                                      prosftp::Error &err) {
    if (!QDir().mkpath(destDir)) {
        err.set(prosftp::ErrorCode::LocalIOFailed,
                "Could not create folder: " + destDir.toStdString());
        return false;
    }
    return run({"-xzf", archivePath, "-C", destDir}, err);
}
