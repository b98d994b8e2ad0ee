#pragma once
#include "SftpClient.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace prosftp {

// Test backend. The "remote" file system is a local sandbox directory:
// remote "/a/b" lives at <sandbox>/a/b. exec() understands the commands the
// transfer engine issues (mkdir -p, rm -f, tar -czf/-xzf with -C, joined by
// &&); tar itself is run locally.
class MockSftpClient : public SftpClient {
public:
    explicit MockSftpClient(std::string sandboxRoot);

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

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

    // Test knobs and recorded calls.
    void setExpectedPassword(std::string pw) { expectedPassword_ = std::move(pw); }
    void setChunkSize(std::size_t n) { chunk_ = n > 0 ? n : 1; }
    void setStatFails(bool v) { statFails_ = v; }
    // Sleeps after every chunk so a transfer stays in flight for a while.
    void setChunkDelay(std::chrono::milliseconds d) { chunkDelay_ = d; }

    std::string localPathFor(const std::string &remote) const;
    const std::vector<std::string> &attemptedPuts() const { return puts_; }
    const std::vector<std::string> &attemptedGets() const { return gets_; }
    const std::vector<std::string> &executedCommands() const { return commands_; }
    int disconnectCount() const { return disconnects_; }

private:
    std::string root_;
    bool connected_ = false;
    std::string expectedPassword_;
    std::size_t chunk_ = 4096;
    bool statFails_ = false;
    std::chrono::milliseconds chunkDelay_{0};
    int disconnects_ = 0;
    std::vector<std::string> puts_;
    std::vector<std::string> gets_;
    std::vector<std::string> commands_;

    bool copyChunked(const std::string &from, const std::string &to,
                     std::uint64_t total, std::string &err,
                     const ProgressCB &progress, const CancelCB &shouldCancel);
    int runSimpleCommand(const std::vector<std::string> &argv,
                         ExecResult &result);
};

} // namespace prosftp
