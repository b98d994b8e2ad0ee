#include "TransferJob.hpp"
#include "prosftp/RemotePath.hpp"

using prosftp::ErrorCode;

const char *transferKindName(TransferKind kind) {
    switch (kind) {
    case TransferKind::UploadFiles:
        return "UploadFiles";
    case TransferKind::UploadFolder:
        return "UploadFolder";
    case TransferKind::DownloadFiles:
        return "DownloadFiles";
    case TransferKind::DownloadFolder:
        return "DownloadFolder";
    }
    return "Unknown";
}

static QStringList nonBlank(const QStringList &in) {
    QStringList out;
    for (const QString &p : in) {
        if (!p.trimmed().isEmpty())
            out << p;
    }
    return out;
}

static QString joined(const QString &dir, const std::string &name) {
    return QString::fromStdString(prosftp::joinRemote(dir.toStdString(), name));
}

bool makeUploadFilesJob(const QStringList &localPaths, const QString &remoteDir,
                        TransferJob &out, prosftp::Error &err) {
    const QStringList files = nonBlank(localPaths);
    if (files.isEmpty()) {
        err.set(ErrorCode::InvalidSelection, "No local files selected.");
        return false;
    }
    out = TransferJob{};
    out.kind = TransferKind::UploadFiles;
    out.sources = files;
    out.destinationDir = remoteDir;
    return true;
}

bool makeUploadFolderJob(const QStringList &localPaths,
                         const QString &remoteDir, bool extractRemote,
                         TransferJob &out, prosftp::Error &err) {
    const QStringList sel = nonBlank(localPaths);
    if (sel.size() != 1) {
        err.set(ErrorCode::InvalidSelection, "Select exactly one folder.");
        return false;
    }
    out = TransferJob{};
    out.kind = TransferKind::UploadFolder;
    out.sources = sel;
    out.destinationDir = remoteDir;
    out.folderMode = extractRemote;
    return true;
}

bool makeDownloadFilesJob(const QString &currentRemoteDir,
                          const std::vector<prosftp::RemoteEntry> &selection,
                          const QString &localDir, TransferJob &out,
                          prosftp::Error &err) {
    if (selection.empty()) {
        err.set(ErrorCode::InvalidSelection, "No remote files selected.");
        return false;
    }
    QStringList files;
    for (const auto &e : selection) {
        if (!e.is_dir)
            files << joined(currentRemoteDir, e.name);
    }
    if (files.isEmpty()) {
        err.set(ErrorCode::InvalidSelection,
                "Selected items contain no files.");
        return false;
    }
    out = TransferJob{};
    out.kind = TransferKind::DownloadFiles;
    out.sources = files;
    out.destinationDir = localDir;
    return true;
}

bool makeDownloadFolderJob(const QString &currentRemoteDir,
                           const std::vector<prosftp::RemoteEntry> &selection,
                           const QString &localDir, bool extractLocal,
                           TransferJob &out, prosftp::Error &err) {
    if (selection.size() != 1 || !selection.front().is_dir) {
        err.set(ErrorCode::InvalidSelection, "Select exactly one folder.");
        return false;
    }
    out = TransferJob{};
    out.kind = TransferKind::DownloadFolder;
    out.sources << joined(currentRemoteDir, selection.front().name);
    out.destinationDir = localDir;
    out.folderMode = extractLocal;
    return true;
}
