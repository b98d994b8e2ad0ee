#include "DirectoryModel.hpp"
#include "Session.hpp"
#include "prosftp/RemotePath.hpp"

#include <algorithm>

static QString normalized(const QString &path) {
    return QString::fromStdString(prosftp::normalizeRemote(path.toStdString()));
}

DirectoryModel::DirectoryModel(QObject *parent)
    : QObject(parent), currentPath_(QStringLiteral("/")) {}

QString DirectoryModel::currentPath() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return currentPath_;
}

std::vector<prosftp::RemoteEntry> DirectoryModel::entries() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_;
}

std::vector<prosftp::RemoteEntry>
DirectoryModel::entriesAt(const QList<int> &rows) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<prosftp::RemoteEntry> out;
    for (int r : rows) {
        if (r >= 0 && r < static_cast<int>(entries_.size()))
            out.push_back(entries_[static_cast<std::size_t>(r)]);
    }
    return out;
}

void DirectoryModel::sortEntries(std::vector<prosftp::RemoteEntry> &entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const prosftp::RemoteEntry &a,
                        const prosftp::RemoteEntry &b) {
                         if (a.is_dir != b.is_dir)
                             return a.is_dir;
                         return QString::compare(QString::fromStdString(a.name),
                                                 QString::fromStdString(b.name),
                                                 Qt::CaseInsensitive) < 0;
                     });
}

bool DirectoryModel::refresh(Session &session, prosftp::Error &err) {
    return navigateTo(session, currentPath(), err);
}

bool DirectoryModel::navigateTo(Session &session, const QString &path,
                                prosftp::Error &err) {
    if (!session.isConnected()) {
        err.set(prosftp::ErrorCode::NotConnected, "Not connected");
        return false;
    }
    const QString target = normalized(path);
    std::vector<prosftp::RemoteEntry> fresh;
    if (!session.list(target, fresh, err))
        return false;
    sortEntries(fresh);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        currentPath_ = target;
        entries_.swap(fresh);
    }
    emit refreshed(target);
    return true;
}

void DirectoryModel::descend(const prosftp::RemoteEntry &entry) {
    if (!entry.is_dir)
        return;
    const std::string child =
        prosftp::joinRemote(currentPath().toStdString(), entry.name);
    emit navigationRequested(QString::fromStdString(child));
}

QString DirectoryModel::parentPath() const {
    return QString::fromStdString(
        prosftp::parentRemote(currentPath().toStdString()));
}

void DirectoryModel::up() {
    if (currentPath() == QLatin1String("/"))
        return;
    emit navigationRequested(parentPath());
}
