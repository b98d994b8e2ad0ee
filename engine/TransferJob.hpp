// Job descriptions, the typed event channel payload and the per-job
// cancellation token.
#pragma once
#include "EngineSettings.hpp"
#include "prosftp/Errors.hpp"
#include "prosftp/SftpTypes.hpp"

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <atomic>
#include <memory>
#include <vector>

enum class TransferKind { UploadFiles, UploadFolder, DownloadFiles, DownloadFolder };

const char *transferKindName(TransferKind kind);

struct TransferJob {
    quint64 id = 0;
    TransferKind kind = TransferKind::UploadFiles;
    QStringList sources;    // local paths for uploads, remote for downloads
    QString destinationDir; // remote for uploads, local for downloads
    bool folderMode = false; // extract after a folder transfer
    EngineSettings settings;
};

struct TransferEvent {
    enum class Type { Progress, Status, Finished };
    Type type = Type::Status;
    quint64 jobId = 0;
    int percent = 0;      // Progress
    QString text;         // Status, Finished
    bool ok = false;      // Finished
    prosftp::ErrorCode error = prosftp::ErrorCode::None; // Finished
};
Q_DECLARE_METATYPE(TransferEvent)

struct JobResult {
    bool ok = false;
    QString message;
    prosftp::Error error;
};

// Shared flag polled by the engine. Copies observe the same flag; a new
// token is made for every job so a cancel never leaks into the next one.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void requestCancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Builders that validate a caller's selection (InvalidSelection on error).
bool makeUploadFilesJob(const QStringList &localPaths, const QString &remoteDir,
                        TransferJob &out, prosftp::Error &err);
bool makeUploadFolderJob(const QStringList &localPaths,
                         const QString &remoteDir, bool extractRemote,
                         TransferJob &out, prosftp::Error &err);
bool makeDownloadFilesJob(const QString &currentRemoteDir,
                          const std::vector<prosftp::RemoteEntry> &selection,
                          const QString &localDir, TransferJob &out,
                          prosftp::Error &err);
bool makeDownloadFolderJob(const QString &currentRemoteDir,
                           const std::vector<prosftp::RemoteEntry> &selection,
                           const QString &localDir, bool extractLocal,
                           TransferJob &out, prosftp::Error &err);
