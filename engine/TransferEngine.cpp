#include "TransferEngine.hpp"
#include "Archiver.hpp"
#include "Session.hpp"
#include "prosftp/RemotePath.hpp"
#include "prosftp/RuntimeLogging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTemporaryFile>
#include <utility>

Q_LOGGING_CATEGORY(pfXfer, "prosftp.transfer")

using prosftp::ErrorCode;

namespace {

QString q(const QString &word) {
    return QString::fromStdString(prosftp::shellQuote(word.toStdString()));
}

QString normalized(const QString &remote) {
    return QString::fromStdString(
        prosftp::normalizeRemote(remote.toStdString()));
}

QString remoteJoin(const QString &dir, const QString &name) {
    return QString::fromStdString(
        prosftp::joinRemote(dir.toStdString(), name.toStdString()));
}

QString remoteBase(const QString &path) {
    return QString::fromStdString(
        prosftp::baseNameRemote(path.toStdString()));
}

const char *logPath(const QString &path, std::string &buf) {
    buf = prosftp::redacted(path.toStdString());
    return buf.c_str();
}

QString commandOutput(const prosftp::ExecResult &r) {
    QString msg = QString::fromStdString(r.err).trimmed();
    if (msg.isEmpty())
        msg = QString::fromStdString(r.out).trimmed();
    if (msg.isEmpty())
        msg = QStringLiteral("exit code %1").arg(r.exit_code);
    return msg;
}

// Removes a local scratch file when the scope ends.
struct LocalTempGuard {
    QString path;
    ~LocalTempGuard() {
        if (path.isEmpty() || !QFileInfo::exists(path))
            return;
        if (!QFile::remove(path)) {
            std::string buf;
            qCWarning(pfXfer) << "Could not remove temporary file"
                              << logPath(path, buf);
        }
    }
};

// Holds the session for the duration of a job.
struct SessionBorrow {
    Session &session;
    bool held;
    explicit SessionBorrow(Session &s) : session(s), held(s.tryBorrow()) {}
    ~SessionBorrow() {
        if (held)
            session.release();
    }
};

const char *successText(TransferKind kind) {
    switch (kind) {
    case TransferKind::UploadFiles:
        return "Upload completed.";
    case TransferKind::UploadFolder:
        return "Folder upload completed.";
    case TransferKind::DownloadFiles:
        return "Download completed.";
    case TransferKind::DownloadFolder:
        return "Folder download completed.";
    }
    return "Completed.";
}

const char *failurePrefix(TransferKind kind) {
    switch (kind) {
    case TransferKind::UploadFiles:
        return "Upload failed: ";
    case TransferKind::UploadFolder:
        return "Folder upload failed: ";
    case TransferKind::DownloadFiles:
        return "Download failed: ";
    case TransferKind::DownloadFolder:
        return "Folder download failed: ";
    }
    return "Failed: ";
}

} // namespace

TransferEngine::TransferEngine(Session &session, Archiver &archiver,
                               CancellationToken token, EventSink sink)
    : session_(session), archiver_(archiver), token_(std::move(token)),
      sink_(std::move(sink)) {}

JobResult TransferEngine::run(const TransferJob &job) {
    jobId_ = job.id;
    lastPercent_ = -1;
    finished_ = false;
    qCInfo(pfXfer) << "job" << job.id << transferKindName(job.kind)
                   << "sources=" << job.sources.size();

    prosftp::Error err;
    bool ok = false;
    SessionBorrow borrow(session_);
    if (!borrow.held) {
        err.set(ErrorCode::JobInFlight, "Another transfer is in progress");
    } else if (!session_.isConnected()) {
        err.set(ErrorCode::NotConnected, "Not connected");
    } else if (job.sources.isEmpty()) {
        const bool upload = job.kind == TransferKind::UploadFiles ||
                            job.kind == TransferKind::UploadFolder;
        err.set(ErrorCode::InvalidSelection, upload
                                                 ? "No local files selected."
                                                 : "No remote files selected.");
    } else {
        switch (job.kind) {
        case TransferKind::UploadFiles:
            ok = uploadFiles(job, err);
            break;
        case TransferKind::UploadFolder:
            ok = uploadFolder(job, err);
            break;
        case TransferKind::DownloadFiles:
            ok = downloadFiles(job, err);
            break;
        case TransferKind::DownloadFolder:
            ok = downloadFolder(job, err);
            break;
        }
        // A cancel that raced the last step still ends the job as cancelled.
        if (ok && token_.isCancelled()) {
            ok = false;
            err.set(ErrorCode::Cancelled, "Cancelled");
        }
    }

    JobResult result;
    result.ok = ok;
    if (ok) {
        result.message = QString::fromLatin1(successText(job.kind));
    } else {
        if (err.ok())
            err.set(ErrorCode::RemoteIOFailed, "Unknown error");
        result.message = QString::fromLatin1(failurePrefix(job.kind)) +
                         QString::fromStdString(err.message);
        result.error = err;
        qCWarning(pfXfer) << "job" << job.id << "failed:"
                          << prosftp::errorCodeName(err.code)
                          << err.message.c_str();
    }
    emitFinished(result);
    return result;
}

bool TransferEngine::uploadFiles(const TransferJob &job, prosftp::Error &err) {
    const QString dest = normalized(job.destinationDir);
    if (!ensureRemoteDir(dest, job, err))
        return false;

    const int n = job.sources.size();
    for (int i = 0; i < n; ++i) {
        if (!checkpoint(err))
            return false;
        const QString &src = job.sources.at(i);
        const QFileInfo fi(src);
        if (!fi.isFile()) {
            err.set(ErrorCode::LocalIOFailed,
                    "Not a regular file: " + src.toStdString());
            return false;
        }
        const QString rp = remoteJoin(dest, fi.fileName());
        emitStatus(QStringLiteral("[%1/%2] Uploading file -> %3")
                       .arg(i + 1)
                       .arg(n)
                       .arg(rp));
        if (!putFile(src, rp, err))
            return false;
    }
    return true;
}

bool TransferEngine::uploadFolder(const TransferJob &job,
                                  prosftp::Error &err) {
    const QFileInfo src(QDir(job.sources.front()).absolutePath());
    if (!src.isDir()) {
        err.set(ErrorCode::InvalidSelection, "Selected path is not a folder.");
        return false;
    }
    if (!checkpoint(err))
        return false;

    const QString dest = normalized(job.destinationDir);
    const QString folderName = src.fileName();

    QTemporaryFile tmp(QDir::tempPath() + QStringLiteral("/prosftp_XXXXXX_") +
                       folderName + QStringLiteral(".tar.gz"));
    tmp.setAutoRemove(false);
    if (!tmp.open()) {
        err.set(ErrorCode::LocalIOFailed,
                "Could not create temporary archive: " +
                    tmp.errorString().toStdString());
        return false;
    }
    LocalTempGuard localTar{tmp.fileName()};
    tmp.close();

    emitStatus(QStringLiteral("Compressing folder..."));
    beginFile();
    if (!archiver_.createTarGz(src.absoluteFilePath(), localTar.path, err))
        return false;

    if (!ensureRemoteDir(dest, job, err))
        return false;

    const QString remoteTar =
        remoteJoin(dest, folderName + QStringLiteral(".tar.gz"));
    emitStatus(QStringLiteral("Uploading compressed folder..."));
    if (!putFile(localTar.path, remoteTar, err))
        return false;

    if (job.folderMode) {
        emitStatus(QStringLiteral("Extracting on remote..."));
        const QString cmd = QStringLiteral("tar -xzf %1 -C %2 && rm -f %1")
                                .arg(q(remoteTar), q(dest));
        if (!runRemote(cmd, job.settings.commandTimeoutSec,
                       "Remote extract failed", err))
            return false;
    }
    return true;
}

bool TransferEngine::downloadFiles(const TransferJob &job,
                                   prosftp::Error &err) {
    const QString localDir = QDir(job.destinationDir).absolutePath();
    if (!QDir().mkpath(localDir)) {
        err.set(ErrorCode::LocalIOFailed,
                "Could not create folder: " + localDir.toStdString());
        return false;
    }

    const int n = job.sources.size();
    for (int i = 0; i < n; ++i) {
        if (!checkpoint(err))
            return false;
        const QString rp = normalized(job.sources.at(i));
        const QString name = remoteBase(rp);
        if (name.isEmpty()) {
            err.set(ErrorCode::InvalidSelection,
                    "Not a file: " + rp.toStdString());
            return false;
        }
        const QString lp = QDir(localDir).filePath(name);
        emitStatus(QStringLiteral("[%1/%2] Downloading -> %3")
                       .arg(i + 1)
                       .arg(n)
                       .arg(lp));
        if (!getFile(rp, lp, err))
            return false;
    }
    return true;
}

bool TransferEngine::downloadFolder(const TransferJob &job,
                                    prosftp::Error &err) {
    const QString remoteFolder = normalized(job.sources.front());
    const QString folderName = remoteBase(remoteFolder);
    if (folderName.isEmpty()) {
        err.set(ErrorCode::InvalidSelection,
                "The root folder cannot be archived.");
        return false;
    }
    const QString localDir = QDir(job.destinationDir).absolutePath();
    if (!QDir().mkpath(localDir)) {
        err.set(ErrorCode::LocalIOFailed,
                "Could not create folder: " + localDir.toStdString());
        return false;
    }
    if (!checkpoint(err))
        return false;

    const QString archiveName =
        QStringLiteral("%1_%2.tar.gz")
            .arg(folderName)
            .arg(QDateTime::currentMSecsSinceEpoch());
    const QString remoteTar =
        remoteJoin(normalized(job.settings.remoteTempDir), archiveName);
    const QString remoteParent = QString::fromStdString(
        prosftp::parentRemote(remoteFolder.toStdString()));

    emitStatus(QStringLiteral("Creating archive on remote..."));
    const QString cmd = QStringLiteral("tar -czf %1 -C %2 %3")
                            .arg(q(remoteTar), q(remoteParent), q(folderName));
    if (!runRemote(cmd, job.settings.commandTimeoutSec,
                   "Remote archive failed", err)) {
        removeRemoteQuietly(remoteTar, job);
        return false;
    }

    const QString localTar = QDir(localDir).filePath(archiveName);
    emitStatus(QStringLiteral("Downloading archive..."));
    if (!getFile(remoteTar, localTar, err)) {
        removeRemoteQuietly(remoteTar, job);
        LocalTempGuard partial{localTar};
        return false;
    }

    emitStatus(QStringLiteral("Cleaning remote temp..."));
    removeRemoteQuietly(remoteTar, job);

    if (job.folderMode) {
        emitStatus(QStringLiteral("Extracting locally..."));
        // The downloaded archive is the only copy left; keep it on failure.
        if (!archiver_.extractTarGz(localTar, localDir, err)) {
            std::string buf;
            qCWarning(pfXfer) << "extract failed, archive kept at"
                              << logPath(localTar, buf);
            return false;
        }
        LocalTempGuard archive{localTar};
    }
    return true;
}

bool TransferEngine::putFile(const QString &local, const QString &remote,
                             prosftp::Error &err) {
    const QFileInfo fi(local);
    if (!fi.isFile() || !fi.isReadable()) {
        err.set(ErrorCode::LocalIOFailed,
                "Cannot read local file: " + local.toStdString());
        return false;
    }
    emitStatus(QStringLiteral("Uploading: %1").arg(remoteBase(remote)));
    const quint64 total = static_cast<quint64>(fi.size());
    beginFile();
    auto progress = [this, total](std::uint64_t done, std::uint64_t) {
        reportBytes(done, total);
    };
    auto shouldCancel = [this]() { return token_.isCancelled(); };
    if (!session_.put(local, remote, err, progress, shouldCancel)) {
        markIfCancelled(err);
        return false;
    }
    endFile();
    return true;
}

bool TransferEngine::getFile(const QString &remote, const QString &local,
                             prosftp::Error &err) {
    emitStatus(QStringLiteral("Downloading: %1").arg(remoteBase(remote)));
    quint64 total = 0;
    prosftp::Error statErr;
    if (!session_.statSize(remote, total, statErr)) {
        std::string buf;
        qCInfo(pfXfer) << "size unknown for" << logPath(remote, buf);
        total = 0;
    }
    beginFile();
    auto progress = [this, total](std::uint64_t done, std::uint64_t) {
        reportBytes(done, total);
    };
    auto shouldCancel = [this]() { return token_.isCancelled(); };
    if (!session_.get(remote, local, err, progress, shouldCancel)) {
        markIfCancelled(err);
        return false;
    }
    endFile();
    return true;
}

bool TransferEngine::ensureRemoteDir(const QString &dir,
                                     const TransferJob &job,
                                     prosftp::Error &err) {
    emitStatus(QStringLiteral("Ensuring remote dir: %1").arg(dir));
    prosftp::ExecResult r;
    if (!session_.execute(QStringLiteral("mkdir -p %1").arg(q(dir)),
                          job.settings.shortCommandTimeoutSec, r, err))
        return false;
    if (r.exit_code == 0)
        return true;
    const QString out = commandOutput(r);
    if (!job.settings.strictMkdir) {
        std::string buf;
        qCWarning(pfXfer) << "mkdir -p" << logPath(dir, buf) << "exited"
                          << r.exit_code;
        return true;
    }
    err.set(ErrorCode::RemoteCommandFailed,
            "Could not create remote directory " + dir.toStdString() + ": " +
                out.toStdString());
    return false;
}

bool TransferEngine::runRemote(const QString &command, int timeoutSec,
                               const char *what, prosftp::Error &err) {
    prosftp::ExecResult r;
    if (!session_.execute(command, timeoutSec, r, err)) {
        err.set(err.code, std::string(what) + ": " + err.message);
        return false;
    }
    if (r.exit_code != 0) {
        err.set(ErrorCode::RemoteCommandFailed,
                std::string(what) + ": " + commandOutput(r).toStdString());
        return false;
    }
    return true;
}

void TransferEngine::removeRemoteQuietly(const QString &path,
                                         const TransferJob &job) {
    prosftp::ExecResult r;
    prosftp::Error err;
    if (!session_.execute(QStringLiteral("rm -f %1").arg(q(path)),
                          job.settings.shortCommandTimeoutSec, r, err)) {
        qCWarning(pfXfer) << "remote cleanup failed:" << err.message.c_str();
        return;
    }
    if (r.exit_code != 0) {
        std::string buf;
        qCWarning(pfXfer) << "remote cleanup of" << logPath(path, buf)
                          << "exited" << r.exit_code;
    }
}

bool TransferEngine::checkpoint(prosftp::Error &err) const {
    if (!token_.isCancelled())
        return true;
    err.set(ErrorCode::Cancelled, "Cancelled");
    return false;
}

void TransferEngine::markIfCancelled(prosftp::Error &err) const {
    if (token_.isCancelled())
        err.set(ErrorCode::Cancelled, "Cancelled");
}

void TransferEngine::beginFile() {
    lastPercent_ = -1;
    emitProgress(0);
}

void TransferEngine::reportBytes(quint64 done, quint64 total) {
    if (total == 0)
        return;
    if (done > total)
        done = total;
    const int pct = static_cast<int>((done * 100) / total);
    if (pct > lastPercent_)
        emitProgress(pct);
}

void TransferEngine::endFile() {
    if (lastPercent_ < 100)
        emitProgress(100);
}

void TransferEngine::emitStatus(const QString &text) {
    if (finished_ || !sink_)
        return;
    TransferEvent ev;
    ev.type = TransferEvent::Type::Status;
    ev.jobId = jobId_;
    ev.text = text;
    sink_(ev);
}

void TransferEngine::emitProgress(int percent) {
    lastPercent_ = percent;
    if (finished_ || !sink_)
        return;
    TransferEvent ev;
    ev.type = TransferEvent::Type::Progress;
    ev.jobId = jobId_;
    ev.percent = percent;
    sink_(ev);
}

void TransferEngine::emitFinished(const JobResult &result) {
    if (finished_)
        return;
    finished_ = true;
    qCInfo(pfXfer) << "job" << jobId_ << "finished ok=" << result.ok;
    if (!sink_)
        return;
    TransferEvent ev;
    ev.type = TransferEvent::Type::Finished;
    ev.jobId = jobId_;
    ev.ok = result.ok;
    ev.text = result.message;
    ev.error = result.error.code;
    sink_(ev);
}
