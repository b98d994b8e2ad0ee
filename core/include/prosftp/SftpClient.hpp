// Abstract remote-protocol collaborator. Concrete backends (libssh2, mock)
// implement this API so the engine stays decoupled from the wire library.
#pragma once
#include "SftpTypes.hpp"
#include <functional>

namespace prosftp {

class SftpClient {
public:
    using ProgressCB =
        std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Transport + auth + SFTP channel. On failure nothing stays open.
    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    // Closes the SFTP channel then the transport; close errors are ignored.
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool list(const std::string &remote_path,
                      std::vector<RemoteEntry> &out, std::string &err) = 0;

    // Size of a remote file. Returns false when unknown.
    virtual bool stat(const std::string &remote_path, std::uint64_t &size,
                      std::string &err) = 0;

    // Streams remote -> local. 'shouldCancel' is polled before each chunk.
    virtual bool get(const std::string &remote, const std::string &local,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    // Streams local -> remote (create/truncate).
    virtual bool put(const std::string &local, const std::string &remote,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}) = 0;

    virtual bool mkdir(const std::string &remote_dir, std::string &err,
                       unsigned int mode = 0755) = 0;

    // Runs a shell command on the remote host and waits for it to exit.
    // Returns false only when the command could not be run or timed out.
    virtual bool exec(const std::string &command, int timeout_sec,
                      ExecResult &result, std::string &err) = 0;
};

} // namespace prosftp
