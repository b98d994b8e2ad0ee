// POSIX-style helpers for remote path strings. No I/O.
#pragma once
#include <string>

namespace prosftp {

// Empty -> "/", '\' -> '/', runs of '/' collapsed, leading '/' guaranteed.
// '.' and '..' segments are kept as-is.
std::string normalizeRemote(const std::string &path);

// Appends a single segment to a normalized base. 'name' is used verbatim.
std::string joinRemote(const std::string &base, const std::string &name);

// Parent directory; "/" for top-level entries and for "/" itself.
std::string parentRemote(const std::string &path);

// Last segment, ignoring trailing '/'.
std::string baseNameRemote(const std::string &path);

// Single-quotes a word for a POSIX shell, escaping embedded quotes.
std::string shellQuote(const std::string &word);

} // namespace prosftp
