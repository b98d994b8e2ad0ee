// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Remote commands run on short-lived session channels.
#include "prosftp/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace prosftp {

namespace {

std::once_flag g_libssh2_init;

constexpr std::size_t kChunk = 64 * 1024;

// Keyboard-interactive context: every prompt is answered with the password.
struct KbdIntCtx {
    const char *pass;
};

void kbint_password_callback(const char *, int, const char *, int,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT *,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                             void **abstract) {
    const KbdIntCtx *ctx =
        (abstract && *abstract) ? static_cast<const KbdIntCtx *>(*abstract)
                                : nullptr;
    const char *pass = ctx ? ctx->pass : nullptr;
    const std::size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0)
            continue;
        // libssh2 releases the response buffers with free().
        char *buf = static_cast<char *>(std::malloc(plen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(plen);
    }
}

int knownHostKeyAlgorithm(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

// Waits until the socket is ready in the direction libssh2 is blocked on.
int waitSocket(int sock, LIBSSH2_SESSION *session, int timeoutMs) {
    struct pollfd pfd {};
    pfd.fd = sock;
    const int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    if (pfd.events == 0)
        pfd.events = POLLIN;
    return ::poll(&pfd, 1, timeoutMs);
}

bool isDirMode(const LIBSSH2_SFTP_ATTRIBUTES &attrs) {
    return (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
           (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, []() { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len <= 0)
        return {};
    return std::string(msg, static_cast<std::size_t>(len));
}

bool Libssh2SftpClient::tcpConnect(const std::string &host,
                                   std::uint16_t port, int timeout_sec,
                                   std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u",
                  static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    const int timeoutMs = timeout_sec > 0 ? timeout_sec * 1000 : -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the timeout applies to the TCP handshake.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd {};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = -1;
            if (::poll(&pfd, 1, timeoutMs) == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) == 0 &&
                    soErr == 0)
                    rc = 0;
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char *home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }
    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = libssh2_knownhost_readfile(
                       nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read the server host key";
        return false;
    }
    const int alg = knownHostKeyAlgorithm(keytype);

    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, opt.host.c_str(), opt.port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
        &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(
            nh, opt.host.c_str(), opt.port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err = "Host key does not match known_hosts";
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "Unknown host (strict policy)";
        return false;
    }

    // AcceptNew: trust the unseen key. Recording it is best effort; an
    // unwritable known_hosts file does not block the connection.
    if (!khPath.empty()) {
        const int addrc = libssh2_knownhost_addc(
            nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            nullptr);
        if (addrc == 0)
            (void)libssh2_knownhost_writefile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::authenticatePassword(const SessionOptions &opt,
                                             std::string &err) {
    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(session_, opt.username.c_str(),
                                          opt.password.c_str());
        if (rc_pw != LIBSSH2_ERROR_EAGAIN)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rc_pw == 0)
        return true;
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "Server closed the connection after the password attempt";
        return false;
    }
    const std::string pwErr = lastSessionError();

    // Some servers only offer password login through keyboard-interactive.
    const char *methods = libssh2_userauth_list(
        session_, opt.username.c_str(),
        static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? methods : "";
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.password.c_str()};
        void **abs = libssh2_session_abstract(session_);
        if (abs)
            *abs = &ctx;
        int rc_kbd = -1;
        for (;;) {
            rc_kbd = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbint_password_callback);
            if (rc_kbd != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs)
            *abs = nullptr;
        if (rc_kbd == 0)
            return true;
    }

    err = "Authentication failed";
    if (!authlist.empty())
        err += " (methods: " + authlist + ")";
    if (!pwErr.empty())
        err += ": " + pwErr;
    return false;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions &opt,
                                         std::string &err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    if (opt.timeout_sec > 0)
        libssh2_session_set_timeout(session_, opt.timeout_sec * 1000L);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err))
        return false;
    if (!authenticatePassword(opt, err))
        return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not open the SFTP channel: " + lastSessionError();
        return false;
    }
    // Transfers and commands carry their own deadlines.
    libssh2_session_set_timeout(session_, 0);
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, std::string &err) {
    disconnect();
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, opt.timeout_sec, err) ||
        !sshHandshakeAuth(opt, err)) {
        // Close whatever did open so no half-open state is left behind.
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        (void)libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        (void)libssh2_session_disconnect(session_, "bye");
        (void)libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<RemoteEntry> &out,
                             std::string &err) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    const std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "Could not open remote directory: " + path;
        return false;
    }

    out.clear();
    // The "ls -l" long form is not requested, so only the name can overflow.
    // libssh2 drops an entry whose name does not fit; such entries are
    // skipped instead of failing the whole listing.
    std::vector<char> filename(4096);
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename.data(),
                                               filename.size(), nullptr, 0,
                                               &attrs);
        if (rc == 0)
            break;
        if (rc == LIBSSH2_ERROR_BUFFER_TOO_SMALL)
            continue;
        if (rc < 0) {
            err = "Reading remote directory failed: " + path;
            libssh2_sftp_closedir(dir);
            return false;
        }
        RemoteEntry e;
        e.name.assign(filename.data(), static_cast<std::size_t>(rc));
        if (e.name == "." || e.name == "..")
            continue;
        e.is_dir = isDirMode(attrs);
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            e.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            e.mtime = attrs.mtime;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
            e.mode = static_cast<std::uint32_t>(attrs.permissions);
        out.push_back(std::move(e));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path,
                             std::uint64_t &size, std::string &err) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             static_cast<unsigned>(remote_path.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = "Remote stat failed: " + remote_path;
        return false;
    }
    if (!(st.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        err = "Remote size unavailable: " + remote_path;
        return false;
    }
    size = st.filesize;
    return true;
}

bool Libssh2SftpClient::get(const std::string &remote,
                            const std::string &local, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }

    // Size is only used for progress; unknown size is not an error.
    std::uint64_t total = 0;
    std::string statErr;
    (void)stat(remote, total, statErr);

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading: " + remote;
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing: " + local;
        return false;
    }

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    bool ok = true;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            ok = false;
            break;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            err = "Remote read failed: " + remote;
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
            static_cast<std::size_t>(n)) {
            err = "Local write failed: " + local;
            ok = false;
            break;
        }
        done += static_cast<std::uint64_t>(n);
        if (progress)
            progress(done, total);
    }

    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

bool Libssh2SftpClient::put(const std::string &local,
                            const std::string &remote, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading: " + local;
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? static_cast<std::uint64_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for writing: " + remote;
        return false;
    }

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    bool ok = true;
    while (ok) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed: " + local;
                ok = false;
            }
            break;
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err = "Cancelled";
                ok = false;
                break;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "Remote write failed: " + remote;
                ok = false;
                break;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
            if (progress)
                progress(done, total);
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir,
                              std::string &err, unsigned int mode) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        err = "Could not create remote directory: " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2SftpClient::exec(const std::string &command, int timeout_sec,
                             ExecResult &result, std::string &err) {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(
                                             timeout_sec > 0 ? timeout_sec : 60);
    auto remainingMs = [&deadline]() -> int {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    result = ExecResult{};
    // The session goes non-blocking for the duration of the command so the
    // deadline can be enforced while draining stdout and stderr.
    libssh2_session_set_blocking(session_, 0);

    LIBSSH2_CHANNEL *ch = nullptr;
    while (!(ch = libssh2_channel_open_session(session_)) &&
           libssh2_session_last_errno(session_) == LIBSSH2_ERROR_EAGAIN) {
        if (remainingMs() == 0)
            break;
        waitSocket(sock_, session_, remainingMs());
    }
    if (!ch) {
        libssh2_session_set_blocking(session_, 1);
        err = "Could not open an exec channel: " + lastSessionError();
        return false;
    }

    int rc = 0;
    while ((rc = libssh2_channel_exec(ch, command.c_str())) ==
           LIBSSH2_ERROR_EAGAIN) {
        if (remainingMs() == 0)
            break;
        waitSocket(sock_, session_, remainingMs());
    }
    bool ok = (rc == 0);
    if (!ok)
        err = "Remote command could not be started: " + lastSessionError();

    char buf[16 * 1024];
    while (ok) {
        bool progressed = false;
        const ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            result.out.append(buf, static_cast<std::size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            err = "Reading remote command output failed";
            ok = false;
            break;
        }
        const ssize_t m = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        if (m > 0) {
            result.err.append(buf, static_cast<std::size_t>(m));
            progressed = true;
        } else if (m < 0 && m != LIBSSH2_ERROR_EAGAIN) {
            err = "Reading remote command errors failed";
            ok = false;
            break;
        }
        if (progressed)
            continue;
        if (libssh2_channel_eof(ch))
            break;
        if (remainingMs() == 0) {
            err = "Remote command timed out";
            ok = false;
            break;
        }
        waitSocket(sock_, session_, remainingMs());
    }

    if (ok) {
        while (libssh2_channel_close(ch) == LIBSSH2_ERROR_EAGAIN &&
               remainingMs() > 0)
            waitSocket(sock_, session_, remainingMs());
        result.exit_code = libssh2_channel_get_exit_status(ch);
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_channel_free(ch);
    return ok;
}

} // namespace prosftp
