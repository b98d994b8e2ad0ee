#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types.
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace prosftp {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    Libssh2SftpClient(const Libssh2SftpClient &) = delete;
    Libssh2SftpClient &operator=(const Libssh2SftpClient &) = delete;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override {
        return connected_ && session_ && sftp_;
    }

    bool list(const std::string &remote_path, std::vector<RemoteEntry> &out,
              std::string &err) override;

    bool stat(const std::string &remote_path, std::uint64_t &size,
              std::string &err) override;

    bool get(const std::string &remote, const std::string &local,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;

    bool put(const std::string &local, const std::string &remote,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}) override;

    bool mkdir(const std::string &remote_dir, std::string &err,
               unsigned int mode = 0755) override;

    bool exec(const std::string &command, int timeout_sec, ExecResult &result,
              std::string &err) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, std::uint16_t port,
                    int timeout_sec, std::string &err);
    bool sshHandshakeAuth(const SessionOptions &opt, std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticatePassword(const SessionOptions &opt, std::string &err);
    std::string lastSessionError() const;
};

} // namespace prosftp
