// Local gzip-compressed tar archives of folder trees.
#pragma once
#include "prosftp/Errors.hpp"

#include <QString>
#include <QStringList>

class Archiver {
public:
    virtual ~Archiver() = default;

    // Archive 'folder' with its base name as the single root entry.
    virtual bool createTarGz(const QString &folder, const QString &archivePath,
                             prosftp::Error &err) = 0;
    virtual bool extractTarGz(const QString &archivePath,
                              const QString &destDir, prosftp::Error &err) = 0;
};

// Runs the system tar binary.
class TarProcessArchiver : public Archiver {
public:
    explicit TarProcessArchiver(QString program = QStringLiteral("tar"),
                                int timeoutMs = 30 * 60 * 1000);

    bool createTarGz(const QString &folder, const QString &archivePath,
                     prosftp::Error &err) override;
    bool extractTarGz(const QString &archivePath, const QString &destDir,
                      prosftp::Error &err) override;

private:
    QString program_;
    int timeoutMs_;

    bool run(const QStringList &args, prosftp::Error &err);
};
