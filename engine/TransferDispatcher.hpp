// Front end for the caller context: queues connection, listing and transfer
// work onto a single background thread and relays results back as signals.
#pragma once
#include "TransferJob.hpp"
#include "prosftp/SftpTypes.hpp"

#include <QObject>
#include <QString>
#include <QThread>
#include <atomic>
#include <mutex>

class Archiver;
class DirectoryModel;
class Session;

class TransferDispatcher : public QObject {
    Q_OBJECT
public:
    TransferDispatcher(Session &session, Archiver &archiver,
                       QObject *parent = nullptr);
    ~TransferDispatcher() override;

    // Returns immediately. Rejects with JobInFlight while a job is
    // outstanding. On success 'job.id' is assigned.
    bool submit(TransferJob &job, prosftp::Error &err);
    // Cancels the running job, if any.
    void cancel();
    bool isBusy() const { return busy_.load(); }

    void requestConnect(const prosftp::SessionOptions &opt);
    void requestDisconnect();
    void requestNavigate(DirectoryModel *model, const QString &path);
    void requestRefresh(DirectoryModel *model);
    void requestMakeDirectory(DirectoryModel *model, const QString &name);

    // Routes the model's descend()/up() requests through requestNavigate().
    void attachModel(DirectoryModel *model);

signals:
    void transferEvent(const TransferEvent &ev);
    void progress(int percent);
    void status(const QString &text);
    void finished(bool ok, const QString &message);
    void busyChanged(bool busy);
    void connectedChanged(bool connected);
    void connectFailed(const QString &message);
    void listingFailed(const QString &message);
    void operationFailed(const QString &message);

private:
    Session &session_;
    Archiver &archiver_;
    QThread thread_;
    QObject *worker_ = nullptr; // lives on thread_
    std::atomic<bool> busy_{false};
    mutable std::mutex mtx_;
    CancellationToken current_;
    quint64 nextId_ = 1;

    template <typename Fn> void post(Fn &&fn);
    void deliver(const TransferEvent &ev);
};
