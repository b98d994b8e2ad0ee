#include "Session.hpp"
#include "prosftp/RuntimeLogging.hpp"

#include <QLoggingCategory>
#include <utility>

Q_LOGGING_CATEGORY(pfSession, "prosftp.session")

using prosftp::ErrorCode;

Session::Session(std::unique_ptr<prosftp::SftpClient> client, QObject *parent)
    : QObject(parent), client_(std::move(client)) {}

Session::~Session() {
    if (client_ && client_->isConnected())
        client_->disconnect();
}

bool Session::isConnected() const { return client_ && client_->isConnected(); }

bool Session::requireConnected(prosftp::Error &err) const {
    if (isConnected())
        return true;
    err.set(ErrorCode::NotConnected, "Not connected");
    return false;
}

bool Session::connectToHost(const prosftp::SessionOptions &opt,
                            prosftp::Error &err) {
    if (isConnected())
        disconnectFromHost();
    if (!client_) {
        err.set(ErrorCode::ConnectFailed, "No SFTP client");
        return false;
    }

    host_.clear();
    username_.clear();
    qCInfo(pfSession) << "connect"
                      << "host=" << prosftp::redacted(opt.host).c_str()
                      << "port=" << opt.port
                      << "user=" << prosftp::redacted(opt.username).c_str();

    std::string cerr;
    if (!client_->connect(opt, cerr)) {
        // The client closes whatever it opened; make sure nothing lingers.
        client_->disconnect();
        qCWarning(pfSession) << "connect failed:" << cerr.c_str();
        err.set(ErrorCode::ConnectFailed,
                cerr.empty() ? std::string("Connection failed") : cerr);
        return false;
    }
    host_ = QString::fromStdString(opt.host);
    username_ = QString::fromStdString(opt.username);
    qCInfo(pfSession) << "connected";
    emit connectedChanged(true);
    return true;
}

void Session::disconnectFromHost() {
    if (client_)
        client_->disconnect();
    qCInfo(pfSession) << "disconnected";
    emit connectedChanged(false);
}

bool Session::execute(const QString &command, int timeoutSec,
                      prosftp::ExecResult &result, prosftp::Error &err) {
    if (!requireConnected(err))
        return false;
    if (prosftp::sensitiveLoggingEnabled())
        qCInfo(pfSession) << "exec" << command;
    std::string cerr;
    if (!client_->exec(command.toStdString(), timeoutSec, result, cerr)) {
        err.set(ErrorCode::RemoteCommandFailed, cerr);
        return false;
    }
    return true;
}

bool Session::list(const QString &path, std::vector<prosftp::RemoteEntry> &out,
                   prosftp::Error &err) {
    if (!requireConnected(err))
        return false;
    std::string cerr;
    if (!client_->list(path.toStdString(), out, cerr)) {
        err.set(ErrorCode::RemoteIOFailed, cerr);
        return false;
    }
    return true;
}

bool Session::statSize(const QString &path, quint64 &size,
                       prosftp::Error &err) {
    if (!requireConnected(err))
        return false;
    std::string cerr;
    std::uint64_t n = 0;
    if (!client_->stat(path.toStdString(), n, cerr)) {
        err.set(ErrorCode::RemoteIOFailed, cerr);
        return false;
    }
    size = n;
    return true;
}

bool Session::put(const QString &local, const QString &remote,
                  prosftp::Error &err,
                  prosftp::SftpClient::ProgressCB progress,
                  prosftp::SftpClient::CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    std::string cerr;
    if (!client_->put(local.toStdString(), remote.toStdString(), cerr,
                      std::move(progress), std::move(shouldCancel))) {
        err.set(ErrorCode::RemoteIOFailed, cerr);
        return false;
    }
    return true;
}

bool Session::get(const QString &remote, const QString &local,
                  prosftp::Error &err,
                  prosftp::SftpClient::ProgressCB progress,
                  prosftp::SftpClient::CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    std::string cerr;
    if (!client_->get(remote.toStdString(), local.toStdString(), cerr,
                      std::move(progress), std::move(shouldCancel))) {
        err.set(ErrorCode::RemoteIOFailed, cerr);
        return false;
    }
    return true;
}

bool Session::makeDirectory(const QString &path, prosftp::Error &err) {
    if (!requireConnected(err))
        return false;
    std::string cerr;
    if (!client_->mkdir(path.toStdString(), cerr)) {
        err.set(ErrorCode::RemoteIOFailed, cerr);
        return false;
    }
    return true;
}

bool Session::tryBorrow() {
    bool expected = false;
    return borrowed_.compare_exchange_strong(expected, true);
}

void Session::release() { borrowed_.store(false); }
