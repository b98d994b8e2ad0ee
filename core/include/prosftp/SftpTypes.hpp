// Basic types shared by the core and the transfer engine.
// Keep these structures plain so they can be copied across threads.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prosftp {

// Host key validation policy.
enum class KnownHostsPolicy {
    Strict,    // Require an exact match in known_hosts.
    AcceptNew, // Trust and record unseen hosts; reject changed keys.
    Off        // No verification.
};

// One row of a remote directory listing.
struct RemoteEntry {
    std::string name; // base name, never contains '/'
    bool is_dir = false;
    std::uint64_t size = 0;             // bytes, only meaningful for files
    std::optional<std::uint64_t> mtime; // epoch seconds
    std::uint32_t mode = 0;             // raw POSIX type/permission bits
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;

    int timeout_sec = 12;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;
};

// Outcome of a remote shell command.
struct ExecResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

} // namespace prosftp
