// Core unit tests without external framework (run via CTest).
#include "prosftp/Errors.hpp"
#include "prosftp/MockSftpClient.hpp"
#include "prosftp/RemotePath.hpp"
#include "prosftp/RuntimeLogging.hpp"
#include "prosftp/SizeFormat.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Fresh sandbox directory per test, removed on scope exit.
struct Sandbox {
    fs::path root;
    Sandbox() {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("prosftp-core-" + std::to_string(static_cast<long long>(now)));
        fs::create_directories(root);
    }
    ~Sandbox() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

void writeFile(const fs::path &p, const std::string &data) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

prosftp::SessionOptions validOptions() {
    prosftp::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    opt.password = "secret";
    return opt;
}

void test_normalize(TestContext &t) {
    using prosftp::normalizeRemote;
    t.check(normalizeRemote("") == "/", "empty path should normalize to /");
    t.check(normalizeRemote("home/user") == "/home/user",
            "relative path should gain a leading /");
    t.check(normalizeRemote("//a///b") == "/a/b",
            "runs of / should collapse");
    t.check(normalizeRemote("\\a\\b") == "/a/b",
            "backslashes should become /");
    t.check(normalizeRemote("/a/../b") == "/a/../b",
            "dot segments are kept verbatim");

    const std::vector<std::string> samples = {
        "", "/", "a", "a//b", "\\x\\\\y/", "/srv/data/", "//", "x/./y"};
    for (const auto &s : samples) {
        const std::string once = normalizeRemote(s);
        t.check(normalizeRemote(once) == once,
                "normalize should be idempotent for '" + s + "'");
        t.check(!once.empty() && once.front() == '/',
                "normalized path should start with / for '" + s + "'");
        t.check(once.find("//") == std::string::npos,
                "normalized path should not contain // for '" + s + "'");
    }
}

void test_join_and_parent(TestContext &t) {
    using prosftp::joinRemote;
    using prosftp::parentRemote;
    t.check(joinRemote("/", "etc") == "/etc", "join at root");
    t.check(joinRemote("/home/u", "f.txt") == "/home/u/f.txt",
            "join adds one separator");
    t.check(joinRemote("/home/u/", "f.txt") == "/home/u/f.txt",
            "join does not double a trailing /");
    t.check(joinRemote("home//u", "f") == joinRemote("/home/u", "f"),
            "join should not depend on base spelling");

    t.check(parentRemote("/") == "/", "parent of / is /");
    t.check(parentRemote("/etc") == "/", "parent of top-level entry is /");
    t.check(parentRemote("/a/b/c") == "/a/b", "parent strips last segment");
    t.check(parentRemote("/a/b/") == "/a", "parent ignores trailing /");
    t.check(parentRemote(joinRemote("/srv/x", "name")) == "/srv/x",
            "parent of join(d, n) is d");
}

void test_basename_and_quote(TestContext &t) {
    using prosftp::baseNameRemote;
    using prosftp::shellQuote;
    t.check(baseNameRemote("/a/b/report.pdf") == "report.pdf",
            "basename of file path");
    t.check(baseNameRemote("/a/dir/") == "dir",
            "basename ignores trailing /");
    t.check(baseNameRemote("/").empty(), "basename of / is empty");

    t.check(shellQuote("plain") == "'plain'", "simple word is single-quoted");
    t.check(shellQuote("with space") == "'with space'",
            "spaces stay inside quotes");
    t.check(shellQuote("it's") == "'it'\\''s'",
            "embedded quote uses the '\\'' escape");
    t.check(shellQuote("") == "''", "empty word quotes to ''");
}

void test_error_names(TestContext &t) {
    using prosftp::ErrorCode;
    t.check(std::string(prosftp::errorCodeName(ErrorCode::Cancelled)) ==
                "Cancelled",
            "Cancelled name");
    t.check(std::string(prosftp::errorCodeName(ErrorCode::JobInFlight)) ==
                "JobInFlight",
            "JobInFlight name");
    prosftp::Error e;
    t.check(e.ok(), "default error should be ok");
    e.set(ErrorCode::RemoteIOFailed, "boom");
    t.check(!e.ok() && e.message == "boom", "set should store code and text");
    e.clear();
    t.check(e.ok() && e.message.empty(), "clear should reset the error");
}

void test_redaction(TestContext &t) {
    ::unsetenv("PROSFTP_ENV");
    ::unsetenv("PROSFTP_LOG_SENSITIVE");
    t.check(prosftp::redacted("/home/alice") == "<redacted>",
            "values are hidden by default");
    t.check(prosftp::redacted("").empty(), "empty values stay empty");

    ::setenv("PROSFTP_LOG_SENSITIVE", "on", 1);
    t.check(!prosftp::sensitiveLoggingEnabled(),
            "the flag alone is not enough outside a dev environment");
    ::setenv("PROSFTP_ENV", " Dev ", 1);
    t.check(prosftp::sensitiveLoggingEnabled(),
            "dev environment plus the flag enables sensitive logging");
    t.check(prosftp::redacted("/home/alice") == "/home/alice",
            "values are shown when enabled");
    ::setenv("PROSFTP_LOG_SENSITIVE", "0", 1);
    t.check(!prosftp::sensitiveLoggingEnabled(), "a false flag disables it");

    ::unsetenv("PROSFTP_ENV");
    ::unsetenv("PROSFTP_LOG_SENSITIVE");
}

void test_human_size(TestContext &t) {
    using prosftp::humanSize;
    t.check(humanSize(0) == "0 B", "0 bytes");
    t.check(humanSize(512) == "512 B", "bytes below 1 KB");
    t.check(humanSize(1536) == "1.5 KB", "1.5 KB");
    t.check(humanSize(3ull * 1024 * 1024) == "3.0 MB", "3 MB");
    t.check(humanSize(2ull * 1024 * 1024 * 1024 * 1024 * 1024) == "2.0 PB",
            "petabytes");
}

void test_mock_connect(TestContext &t) {
    Sandbox box;
    prosftp::MockSftpClient c(box.root.string());
    c.setExpectedPassword("secret");
    std::string err;

    auto opt = validOptions();
    opt.host.clear();
    t.check(!c.connect(opt, err), "connect should fail without host");

    opt = validOptions();
    opt.password = "wrong";
    err.clear();
    t.check(!c.connect(opt, err), "connect should fail with a bad password");
    t.checkContains(err, "Authentication failed", "auth failure text");
    t.check(!c.isConnected(), "failed connect leaves client disconnected");

    err.clear();
    t.check(c.connect(validOptions(), err), "connect should succeed");
    t.check(c.isConnected(), "client should report connected");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should drop the connection");

    std::vector<prosftp::RemoteEntry> entries;
    t.check(!c.list("/", entries, err), "list requires a connection");
}

void test_mock_transfers(TestContext &t) {
    Sandbox box;
    prosftp::MockSftpClient c(box.root.string());
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    const fs::path local = box.root / "local.bin";
    writeFile(local, std::string(10000, 'x'));
    c.setChunkSize(1000);

    {
        prosftp::ExecResult r;
        t.check(c.exec("mkdir -p '/up/dir'", 5, r, err), "exec mkdir");
        t.check(r.exit_code == 0, "mkdir -p should exit 0");
    }

    int calls = 0;
    std::uint64_t last = 0;
    t.check(c.put(local.string(), "/up/dir/a.bin", err,
                  [&](std::uint64_t done, std::uint64_t total) {
                      ++calls;
                      last = done;
                      t.check(total == 10000, "put total is the file size");
                  }),
            "put should succeed");
    t.check(calls == 10, "put should report one progress call per chunk");
    t.check(last == 10000, "last progress equals file size");
    t.check(readFile(box.root / "up/dir/a.bin") == std::string(10000, 'x'),
            "put content lands in the sandbox");

    std::uint64_t size = 0;
    t.check(c.stat("/up/dir/a.bin", size, err) && size == 10000,
            "stat reports the remote size");

    int seen = 0;
    err.clear();
    const fs::path back = box.root / "back.bin";
    t.check(!c.get("/up/dir/a.bin", back.string(), err, {},
                   [&seen]() { return ++seen > 3; }),
            "get should stop when cancelled");
    t.check(err == "Cancelled", "cancelled get reports Cancelled");

    std::vector<prosftp::RemoteEntry> entries;
    t.check(c.list("/up", entries, err) && entries.size() == 1 &&
                entries[0].is_dir && entries[0].name == "dir",
            "list shows the created directory");
}

void test_mock_exec(TestContext &t) {
    Sandbox box;
    prosftp::MockSftpClient c(box.root.string());
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    prosftp::ExecResult r;
    t.check(c.exec("frobnicate --now", 5, r, err),
            "unsupported commands still run");
    t.check(r.exit_code == 127, "unsupported command exits 127");
    t.checkContains(r.err, "unsupported", "unsupported command stderr");

    writeFile(box.root / "src/it's here/f.txt", "payload");
    t.check(c.exec("mkdir -p '/tmp'", 5, r, err) && r.exit_code == 0,
            "mkdir -p /tmp");
    t.check(c.exec("tar -czf '/tmp/a.tar.gz' -C '/src' 'it'\\''s here'", 5, r,
                   err),
            "tar create runs");
    t.check(r.exit_code == 0, "tar create exits 0: " + r.err);
    t.check(c.exec("mkdir -p '/dst' && tar -xzf '/tmp/a.tar.gz' -C '/dst' "
                   "&& rm -f '/tmp/a.tar.gz'",
                   5, r, err),
            "chained extract runs");
    t.check(r.exit_code == 0, "chained extract exits 0: " + r.err);
    t.check(readFile(box.root / "dst/it's here/f.txt") == "payload",
            "extracted file matches");
    t.check(!fs::exists(box.root / "tmp/a.tar.gz"),
            "rm -f removes the archive");
    t.check(c.executedCommands().size() == 4,
            "every exec is recorded");
}

} // namespace

int main() {
    TestContext t;
    test_normalize(t);
    test_join_and_parent(t);
    test_basename_and_quote(t);
    test_error_names(t);
    test_redaction(t);
    test_human_size(t);
    test_mock_connect(t);
    test_mock_transfers(t);
    test_mock_exec(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] prosftp_core_tests\n";
    return EXIT_SUCCESS;
}
