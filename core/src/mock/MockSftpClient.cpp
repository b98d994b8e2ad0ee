#include "prosftp/MockSftpClient.hpp"
#include "prosftp/RemotePath.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <thread>
#include <sys/stat.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace prosftp {

namespace {

// Splits a shell command line into words. Handles single quotes, including
// the '\'' escape produced by shellQuote(). "&&" becomes its own word.
std::vector<std::string> shellWords(const std::string &line) {
    std::vector<std::string> words;
    std::string cur;
    bool inWord = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '\'') {
            const std::size_t close = line.find('\'', i + 1);
            const std::size_t end = close == std::string::npos ? line.size() : close;
            cur.append(line, i + 1, end - i - 1);
            inWord = true;
            i = end;
        } else if (c == '\\' && i + 1 < line.size()) {
            cur.push_back(line[++i]);
            inWord = true;
        } else if (c == ' ' || c == '\t') {
            if (inWord)
                words.push_back(cur);
            cur.clear();
            inWord = false;
        } else {
            cur.push_back(c);
            inWord = true;
        }
    }
    if (inWord)
        words.push_back(cur);
    return words;
}

int runLocal(const std::string &cmd, std::string &output) {
    FILE *p = ::popen((cmd + " 2>&1").c_str(), "r");
    if (!p) {
        output = "popen failed";
        return 127;
    }
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), p)) > 0)
        output.append(buf, n);
    const int status = ::pclose(p);
    if (status == -1)
        return 127;
    return WIFEXITED(status) ? WEXITSTATUS(status) : 128;
}

} // namespace

MockSftpClient::MockSftpClient(std::string sandboxRoot)
    : root_(std::move(sandboxRoot)) {}

std::string MockSftpClient::localPathFor(const std::string &remote) const {
    return root_ + normalizeRemote(remote);
}

bool MockSftpClient::connect(const SessionOptions &opt, std::string &err) {
    disconnect();
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (!expectedPassword_.empty() && opt.password != expectedPassword_) {
        err = "Authentication failed";
        return false;
    }
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        err = "Mock sandbox unavailable: " + ec.message();
        return false;
    }
    connected_ = true;
    return true;
}

void MockSftpClient::disconnect() {
    ++disconnects_;
    connected_ = false;
}

bool MockSftpClient::list(const std::string &remote_path,
                          std::vector<RemoteEntry> &out, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string dir = localPathFor(remote_path);
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = "Remote path not found in mock: " + normalizeRemote(remote_path);
        return false;
    }
    out.clear();
    for (const auto &de : it) {
        RemoteEntry e;
        e.name = de.path().filename().string();
        struct ::stat st {};
        if (::stat(de.path().c_str(), &st) == 0) {
            e.is_dir = S_ISDIR(st.st_mode);
            e.size = e.is_dir ? 0 : static_cast<std::uint64_t>(st.st_size);
            e.mtime = static_cast<std::uint64_t>(st.st_mtime);
            e.mode = static_cast<std::uint32_t>(st.st_mode);
        }
        out.push_back(std::move(e));
    }
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, std::uint64_t &size,
                          std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (statFails_) {
        err = "Mock stat disabled";
        return false;
    }
    std::error_code ec;
    const auto n = fs::file_size(localPathFor(remote_path), ec);
    if (ec) {
        err = "Remote stat failed: " + remote_path;
        return false;
    }
    size = static_cast<std::uint64_t>(n);
    return true;
}

bool MockSftpClient::copyChunked(const std::string &from,
                                 const std::string &to, std::uint64_t total,
                                 std::string &err, const ProgressCB &progress,
                                 const CancelCB &shouldCancel) {
    std::ifstream in(from, std::ios::binary);
    if (!in.is_open()) {
        err = "Could not open for reading: " + from;
        return false;
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err = "Could not open for writing: " + to;
        return false;
    }
    std::vector<char> buf(chunk_);
    std::uint64_t done = 0;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            return false;
        }
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize n = in.gcount();
        if (n <= 0)
            break;
        out.write(buf.data(), n);
        if (!out) {
            err = "Write failed: " + to;
            return false;
        }
        done += static_cast<std::uint64_t>(n);
        if (progress)
            progress(done, total);
        if (chunkDelay_.count() > 0)
            std::this_thread::sleep_for(chunkDelay_);
    }
    out.flush();
    if (!out) {
        err = "Write failed: " + to;
        return false;
    }
    return true;
}

bool MockSftpClient::get(const std::string &remote, const std::string &local,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    gets_.push_back(remote);
    std::error_code ec;
    const std::string src = localPathFor(remote);
    const auto total = fs::file_size(src, ec);
    if (ec) {
        err = "No such remote file: " + remote;
        return false;
    }
    return copyChunked(src, local, static_cast<std::uint64_t>(total), err,
                       progress, shouldCancel);
}

bool MockSftpClient::put(const std::string &local, const std::string &remote,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    puts_.push_back(remote);
    std::error_code ec;
    const auto total = fs::file_size(local, ec);
    if (ec) {
        err = "Could not open local file for reading: " + local;
        return false;
    }
    return copyChunked(local, localPathFor(remote),
                       static_cast<std::uint64_t>(total), err, progress,
                       shouldCancel);
}

bool MockSftpClient::mkdir(const std::string &remote_dir, std::string &err,
                           unsigned int) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::error_code ec;
    if (!fs::create_directory(localPathFor(remote_dir), ec)) {
        err = "Could not create remote directory: " + remote_dir;
        return false;
    }
    return true;
}

int MockSftpClient::runSimpleCommand(const std::vector<std::string> &argv,
                                     ExecResult &result) {
    std::error_code ec;
    if (argv.size() == 3 && argv[0] == "mkdir" && argv[1] == "-p") {
        const std::string dir = localPathFor(argv[2]);
        fs::create_directories(dir, ec);
        if (ec || !fs::is_directory(dir)) {
            result.err += "mkdir: cannot create directory '" + argv[2] + "'\n";
            return 1;
        }
        return 0;
    }
    if (argv.size() == 3 && argv[0] == "rm" && argv[1] == "-f") {
        fs::remove(localPathFor(argv[2]), ec);
        return 0;
    }
    if (argv.size() >= 5 && argv[0] == "tar" && argv[3] == "-C") {
        std::string cmd = "tar " + argv[1] + " " +
                          shellQuote(localPathFor(argv[2])) + " -C " +
                          shellQuote(localPathFor(argv[4]));
        for (std::size_t i = 5; i < argv.size(); ++i)
            cmd += " " + shellQuote(argv[i]);
        if (argv[1] != "-czf" && argv[1] != "-xzf") {
            result.err += "mock: unsupported tar mode " + argv[1] + "\n";
            return 2;
        }
        std::string output;
        const int code = runLocal(cmd, output);
        if (code != 0)
            result.err += output;
        return code;
    }
    std::string joined;
    for (const auto &a : argv)
        joined += (joined.empty() ? "" : " ") + a;
    result.err += "mock: unsupported command: " + joined + "\n";
    return 127;
}

bool MockSftpClient::exec(const std::string &command, int, ExecResult &result,
                          std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    commands_.push_back(command);
    result = ExecResult{};

    std::vector<std::string> argv;
    const std::vector<std::string> words = shellWords(command);
    for (std::size_t i = 0; i <= words.size(); ++i) {
        if (i < words.size() && words[i] != "&&") {
            argv.push_back(words[i]);
            continue;
        }
        if (argv.empty())
            continue;
        result.exit_code = runSimpleCommand(argv, result);
        if (result.exit_code != 0)
            return true;
        argv.clear();
    }
    if (result.exit_code == -1)
        result.exit_code = 0;
    return true;
}

} // namespace prosftp
