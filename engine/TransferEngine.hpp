// Runs one transfer job to completion on the calling (background) thread.
//
// Events are delivered synchronously through the sink: Status lines and
// Progress percentages in order, then exactly one Finished event. Nothing is
// emitted after Finished. The engine borrows the session and the archiver for
// the duration of run() and keeps no reference to the job afterwards.
#pragma once
#include "TransferJob.hpp"

#include <QString>
#include <functional>

class Archiver;
class Session;

class TransferEngine {
public:
    using EventSink = std::function<void(const TransferEvent &)>;

    TransferEngine(Session &session, Archiver &archiver,
                   CancellationToken token, EventSink sink);

    JobResult run(const TransferJob &job);

private:
    Session &session_;
    Archiver &archiver_;
    CancellationToken token_;
    EventSink sink_;
    quint64 jobId_ = 0;
    int lastPercent_ = -1;
    bool finished_ = false;

    bool uploadFiles(const TransferJob &job, prosftp::Error &err);
    bool uploadFolder(const TransferJob &job, prosftp::Error &err);
    bool downloadFiles(const TransferJob &job, prosftp::Error &err);
    bool downloadFolder(const TransferJob &job, prosftp::Error &err);

    // Single-file primitives with progress and cancellation.
    bool putFile(const QString &local, const QString &remote,
                 prosftp::Error &err);
    bool getFile(const QString &remote, const QString &local,
                 prosftp::Error &err);

    bool ensureRemoteDir(const QString &dir, const TransferJob &job,
                         prosftp::Error &err);
    bool runRemote(const QString &command, int timeoutSec, const char *what,
                   prosftp::Error &err);
    void removeRemoteQuietly(const QString &path, const TransferJob &job);

    bool checkpoint(prosftp::Error &err) const;
    void markIfCancelled(prosftp::Error &err) const;

    void beginFile();
    void reportBytes(quint64 done, quint64 total);
    void endFile();

    void emitStatus(const QString &text);
    void emitProgress(int percent);
    void emitFinished(const JobResult &result);
};
