// Zero-or-one live connection to a remote host: transport, authentication
// and the SFTP channel, plus remote shell commands.
#pragma once
#include "prosftp/Errors.hpp"
#include "prosftp/SftpClient.hpp"

#include <QObject>
#include <QString>
#include <atomic>
#include <memory>
#include <vector>

// Used from the background context only. The client is owned by the session
// and borrowed by jobs for their duration.
class Session : public QObject {
    Q_OBJECT
public:
    explicit Session(std::unique_ptr<prosftp::SftpClient> client,
                     QObject *parent = nullptr);
    ~Session() override;

    // Drops any previous connection first. On failure the session is left
    // disconnected and err carries ConnectFailed with the cause.
    bool connectToHost(const prosftp::SessionOptions &opt, prosftp::Error &err);
    // Idempotent; always emits connectedChanged(false).
    void disconnectFromHost();
    bool isConnected() const;

    QString host() const { return host_; }
    QString username() const { return username_; }

    bool execute(const QString &command, int timeoutSec,
                 prosftp::ExecResult &result, prosftp::Error &err);

    bool list(const QString &path, std::vector<prosftp::RemoteEntry> &out,
              prosftp::Error &err);
    bool statSize(const QString &path, quint64 &size, prosftp::Error &err);
    bool put(const QString &local, const QString &remote, prosftp::Error &err,
             prosftp::SftpClient::ProgressCB progress,
             prosftp::SftpClient::CancelCB shouldCancel);
    bool get(const QString &remote, const QString &local, prosftp::Error &err,
             prosftp::SftpClient::ProgressCB progress,
             prosftp::SftpClient::CancelCB shouldCancel);
    bool makeDirectory(const QString &path, prosftp::Error &err);

    // A transfer job holds the session for its whole run. Fails when
    // another job already holds it.
    bool tryBorrow();
    void release();

signals:
    void connectedChanged(bool connected);

private:
    std::unique_ptr<prosftp::SftpClient> client_;
    QString host_;
    QString username_;
    std::atomic<bool> borrowed_{false};

    bool requireConnected(prosftp::Error &err) const;
};
