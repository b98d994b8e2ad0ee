#include "TransferDispatcher.hpp"
#include "DirectoryModel.hpp"
#include "Session.hpp"
#include "TransferEngine.hpp"
#include "prosftp/RemotePath.hpp"
#include "prosftp/RuntimeLogging.hpp"

#include <QLoggingCategory>
#include <QMetaObject>
#include <utility>

Q_LOGGING_CATEGORY(pfDispatch, "prosftp.dispatch")

using prosftp::ErrorCode;

TransferDispatcher::TransferDispatcher(Session &session, Archiver &archiver,
                                       QObject *parent)
    : QObject(parent), session_(session), archiver_(archiver) {
    qRegisterMetaType<TransferEvent>("TransferEvent");
    thread_.setObjectName(QStringLiteral("prosftp-worker"));
    worker_ = new QObject();
    worker_->moveToThread(&thread_);
    // Session signals are raised on the worker thread and arrive queued.
    connect(&session_, &Session::connectedChanged, this,
            &TransferDispatcher::connectedChanged);
    thread_.start();
}

TransferDispatcher::~TransferDispatcher() {
    cancel();
    thread_.quit();
    thread_.wait();
    delete worker_;
}

template <typename Fn> void TransferDispatcher::post(Fn &&fn) {
    QMetaObject::invokeMethod(worker_, std::forward<Fn>(fn),
                              Qt::QueuedConnection);
}

bool TransferDispatcher::submit(TransferJob &job, prosftp::Error &err) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        err.set(ErrorCode::JobInFlight, "Another transfer is in progress");
        return false;
    }
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        job.id = nextId_++;
        current_ = token;
    }
    qCInfo(pfDispatch) << "submit job" << job.id << transferKindName(job.kind);
    emit busyChanged(true);

    post([this, job, token]() {
        TransferEngine engine(session_, archiver_, token,
                              [this](const TransferEvent &ev) {
                                  QMetaObject::invokeMethod(
                                      this, [this, ev]() { deliver(ev); },
                                      Qt::QueuedConnection);
                              });
        engine.run(job);
    });
    return true;
}

void TransferDispatcher::cancel() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (busy_.load()) {
        qCInfo(pfDispatch) << "cancel requested";
        current_.requestCancel();
    }
}

void TransferDispatcher::deliver(const TransferEvent &ev) {
    switch (ev.type) {
    case TransferEvent::Type::Progress:
        emit transferEvent(ev);
        emit progress(ev.percent);
        break;
    case TransferEvent::Type::Status:
        emit transferEvent(ev);
        emit status(ev.text);
        break;
    case TransferEvent::Type::Finished:
        // Cleared here, on the caller thread, so a submit() can never slip in
        // between the end of the job and its terminal signals.
        busy_.store(false);
        emit busyChanged(false);
        emit transferEvent(ev);
        emit finished(ev.ok, ev.text);
        break;
    }
}

void TransferDispatcher::requestConnect(const prosftp::SessionOptions &opt) {
    post([this, opt]() {
        prosftp::Error err;
        if (session_.connectToHost(opt, err))
            return;
        const QString msg = QString::fromStdString(err.message);
        QMetaObject::invokeMethod(
            this, [this, msg]() { emit connectFailed(msg); },
            Qt::QueuedConnection);
    });
}

void TransferDispatcher::requestDisconnect() {
    post([this]() { session_.disconnectFromHost(); });
}

void TransferDispatcher::requestNavigate(DirectoryModel *model,
                                         const QString &path) {
    if (!model)
        return;
    post([this, model, path]() {
        prosftp::Error err;
        if (model->navigateTo(session_, path, err))
            return;
        qCWarning(pfDispatch)
            << "listing"
            << prosftp::redacted(path.toStdString()).c_str() << "failed";
        const QString msg = QString::fromStdString(err.message);
        QMetaObject::invokeMethod(
            this, [this, msg]() { emit listingFailed(msg); },
            Qt::QueuedConnection);
    });
}

void TransferDispatcher::requestRefresh(DirectoryModel *model) {
    if (!model)
        return;
    requestNavigate(model, model->currentPath());
}

void TransferDispatcher::requestMakeDirectory(DirectoryModel *model,
                                              const QString &name) {
    if (!model || name.trimmed().isEmpty())
        return;
    post([this, model, name]() {
        const QString path = QString::fromStdString(prosftp::joinRemote(
            model->currentPath().toStdString(), name.toStdString()));
        prosftp::Error err;
        if (!session_.makeDirectory(path, err)) {
            const QString msg = QStringLiteral("Could not create %1: %2")
                                    .arg(path, QString::fromStdString(
                                                   err.message));
            QMetaObject::invokeMethod(
                this, [this, msg]() { emit operationFailed(msg); },
                Qt::QueuedConnection);
            return;
        }
        if (!model->refresh(session_, err)) {
            const QString msg = QString::fromStdString(err.message);
            QMetaObject::invokeMethod(
                this, [this, msg]() { emit listingFailed(msg); },
                Qt::QueuedConnection);
        }
    });
}

void TransferDispatcher::attachModel(DirectoryModel *model) {
    if (!model)
        return;
    connect(model, &DirectoryModel::navigationRequested, this,
            [this, model](const QString &path) { requestNavigate(model, path); });
}
