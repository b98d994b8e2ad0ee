// Current remote directory and its sorted listing.
#pragma once
#include "prosftp/Errors.hpp"
#include "prosftp/SftpTypes.hpp"

#include <QList>
#include <QObject>
#include <QString>
#include <mutex>
#include <vector>

class Session;

class DirectoryModel : public QObject {
    Q_OBJECT
public:
    explicit DirectoryModel(QObject *parent = nullptr);

    QString currentPath() const;
    // Snapshot copies; a refresh on another thread never shows half a list.
    std::vector<prosftp::RemoteEntry> entries() const;
    std::vector<prosftp::RemoteEntry> entriesAt(const QList<int> &rows) const;

    // Re-lists currentPath().
    bool refresh(Session &session, prosftp::Error &err);
    // Lists 'path'; path and entries only change when the listing succeeds.
    bool navigateTo(Session &session, const QString &path,
                    prosftp::Error &err);

    // Navigation requests only; state changes go through navigateTo().
    void descend(const prosftp::RemoteEntry &entry);
    void up();
    QString parentPath() const;

    // Directories first, then case-insensitive name.
    static void sortEntries(std::vector<prosftp::RemoteEntry> &entries);

signals:
    void navigationRequested(const QString &path);
    void refreshed(const QString &path);

private:
    mutable std::mutex mtx_;
    QString currentPath_;
    std::vector<prosftp::RemoteEntry> entries_;
};
