// Integration tests for the libssh2 backend and the transfer engine against a
// real SFTP server. Skipped (exit code 77) unless the PROSFTP_IT_* env vars
// exist. The server must provide a POSIX shell with tar.
#include "Archiver.hpp"
#include "DirectoryModel.hpp"
#include "EngineSettings.hpp"
#include "Session.hpp"
#include "TransferEngine.hpp"
#include "TransferJob.hpp"
#include "prosftp/Libssh2SftpClient.hpp"
#include "prosftp/RemotePath.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    bool ok = false;
    const int n = QString::fromStdString(*raw).toInt(&ok);
    if (!ok || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

bool writeFile(const QString &path, const QByteArray &data) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(data) == data.size();
}

QByteArray readFile(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return QByteArray();
    return f.readAll();
}

JobResult runJob(Session &session, Archiver &archiver, const TransferJob &job) {
    TransferEngine engine(session, archiver, CancellationToken(),
                          [](const TransferEvent &) {});
    return engine.run(job);
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    const auto host = envValue("PROSFTP_IT_SFTP_HOST");
    const auto user = envValue("PROSFTP_IT_SFTP_USER");
    const auto pass = envValue("PROSFTP_IT_SFTP_PASS");
    const std::string remoteBase =
        envValue("PROSFTP_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] prosftp_libssh2_integration_tests requires env "
                     "vars: PROSFTP_IT_SFTP_HOST, PROSFTP_IT_SFTP_USER and "
                     "PROSFTP_IT_SFTP_PASS\n";
        return kSkipExitCode;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("PROSFTP_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] PROSFTP_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    EngineSettings settings;
    settings.port = port;
    settings.remoteTempDir = QString::fromStdString(remoteBase);
    prosftp::SessionOptions opt = settings.sessionOptions(
        QString::fromStdString(*host), QString::fromStdString(*user),
        QString::fromStdString(*pass));
    opt.known_hosts_policy = prosftp::KnownHostsPolicy::Off;

    QTemporaryDir tmp;
    if (!tmp.isValid()) {
        std::cerr << "[FAIL] could not create a local temporary directory\n";
        return EXIT_FAILURE;
    }

    Session session(std::make_unique<prosftp::Libssh2SftpClient>());
    TarProcessArchiver archiver;

    prosftp::Error err;
    prosftp::SessionOptions wrong = opt;
    wrong.password = *pass + "-not-it";
    t.check(!session.connectToHost(wrong, err) &&
                err.code == prosftp::ErrorCode::ConnectFailed,
            "wrong password should fail with ConnectFailed");
    t.check(!session.isConnected(), "session stays disconnected after failure");

    err.clear();
    if (!session.connectToHost(opt, err)) {
        std::cerr << "[FAIL] connect: " << err.message << "\n";
        return EXIT_FAILURE;
    }

    const QString suite = QString::fromStdString(prosftp::joinRemote(
        remoteBase,
        "prosftp-it-" +
            std::to_string(QDateTime::currentMSecsSinceEpoch())));

    prosftp::ExecResult r;
    t.check(session.execute("echo hello", 30, r, err) && r.exit_code == 0 &&
                r.out.find("hello") != std::string::npos,
            "exec should capture stdout and exit code");
    t.check(session.execute("sh -c 'echo oops >&2; exit 3'", 30, r, err) &&
                r.exit_code == 3 && r.err.find("oops") != std::string::npos,
            "exec should capture stderr and a non-zero exit code");

    // Files: upload two, list them, download them back.
    const QString a = tmp.filePath("up/a.txt");
    const QString b = tmp.filePath("up/b b.bin");
    QByteArray big(300 * 1024, '\0');
    for (int i = 0; i < big.size(); ++i)
        big[i] = static_cast<char>(i % 251);
    // Near the usual 255 byte file name limit.
    const QString longName = QString(240, QLatin1Char('n')) + ".txt";
    const QString c = tmp.filePath("up/" + longName);
    writeFile(a, "alpha\n");
    writeFile(b, big);
    writeFile(c, "long");

    TransferJob job;
    t.check(makeUploadFilesJob({a, b, c}, suite + "/files", job, err),
            "build upload job");
    job.settings = settings;
    JobResult res = runJob(session, archiver, job);
    t.check(res.ok, "upload files: " + res.message.toStdString());

    DirectoryModel model;
    t.check(model.navigateTo(session, suite + "/files", err),
            "list uploaded files");
    const auto entries = model.entries();
    t.check(entries.size() == 3, "three files listed");
    t.check(std::any_of(entries.begin(), entries.end(),
                        [&longName](const prosftp::RemoteEntry &e) {
                            return e.name == longName.toStdString();
                        }),
            "a long file name is listed in full");
    t.check(std::any_of(entries.begin(), entries.end(),
                        [](const prosftp::RemoteEntry &e) {
                            return e.name == "b b.bin" && e.size == 300 * 1024;
                        }),
            "listing reports name and size");

    t.check(makeDownloadFilesJob(model.currentPath(), entries,
                                 tmp.filePath("down"), job, err),
            "build download job");
    job.settings = settings;
    res = runJob(session, archiver, job);
    t.check(res.ok, "download files: " + res.message.toStdString());
    t.check(readFile(tmp.filePath("down/b b.bin")) == big,
            "downloaded binary matches");
    t.check(readFile(tmp.filePath("down/" + longName)) == "long",
            "file with a long name comes back");

    // Folders: archive round trip through the remote shell.
    const QString tree = tmp.filePath("tree");
    writeFile(tree + "/top.txt", "top");
    writeFile(tree + "/nested/dir/leaf.txt", "leaf");
    t.check(makeUploadFolderJob({tree}, suite + "/folders", true, job, err),
            "build folder upload");
    job.settings = settings;
    res = runJob(session, archiver, job);
    t.check(res.ok, "upload folder: " + res.message.toStdString());

    prosftp::RemoteEntry treeEntry;
    treeEntry.name = "tree";
    treeEntry.is_dir = true;
    t.check(makeDownloadFolderJob(suite + "/folders", {treeEntry},
                                  tmp.filePath("back"), true, job, err),
            "build folder download");
    job.settings = settings;
    res = runJob(session, archiver, job);
    t.check(res.ok, "download folder: " + res.message.toStdString());
    t.check(readFile(tmp.filePath("back/tree/nested/dir/leaf.txt")) == "leaf",
            "folder round trip keeps nested files");

    const QString cleanup =
        QStringLiteral("rm -rf %1")
            .arg(QString::fromStdString(
                prosftp::shellQuote(suite.toStdString())));
    if (!session.execute(cleanup, 60, r, err) || r.exit_code != 0)
        std::cerr << "[WARN] cleanup failed for " << suite.toStdString()
                  << "\n";

    session.disconnectFromHost();
    t.check(!session.isConnected(), "disconnect");

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] prosftp_libssh2_integration_tests\n";
    return EXIT_SUCCESS;
}
