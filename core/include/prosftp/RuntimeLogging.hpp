// Decides whether hosts, user names and remote paths may appear in logs.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace prosftp {

namespace detail {

// True when the variable, trimmed and lowercased, is one of 'accepted'.
inline bool envIsOneOf(const char *name,
                       std::initializer_list<const char *> accepted) {
    const char *raw = std::getenv(name);
    if (!raw)
        return false;
    std::string v;
    for (const char *p = raw; *p; ++p) {
        const auto c = static_cast<unsigned char>(*p);
        if (!std::isspace(c))
            v.push_back(static_cast<char>(std::tolower(c)));
    }
    return std::any_of(accepted.begin(), accepted.end(),
                       [&v](const char *a) { return v == a; });
}

} // namespace detail

// Needs PROSFTP_ENV set to a development value and PROSFTP_LOG_SENSITIVE on.
inline bool sensitiveLoggingEnabled() {
    return detail::envIsOneOf("PROSFTP_ENV",
                              {"dev", "development", "local", "debug"}) &&
           detail::envIsOneOf("PROSFTP_LOG_SENSITIVE",
                              {"1", "true", "yes", "on"});
}

inline std::string redacted(const std::string &value) {
    if (value.empty() || sensitiveLoggingEnabled())
        return value;
    return "<redacted>";
}

} // namespace prosftp
