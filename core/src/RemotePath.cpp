#include "prosftp/RemotePath.hpp"

namespace prosftp {

std::string normalizeRemote(const std::string &path) {
    if (path.empty())
        return "/";
    std::string out;
    out.reserve(path.size() + 1);
    if (path[0] != '/' && path[0] != '\\')
        out.push_back('/');
    for (char c : path) {
        if (c == '\\')
            c = '/';
        if (c == '/' && !out.empty() && out.back() == '/')
            continue;
        out.push_back(c);
    }
    return out;
}

std::string joinRemote(const std::string &base, const std::string &name) {
    std::string b = normalizeRemote(base);
    if (b.back() == '/')
        return b + name;
    return b + "/" + name;
}

std::string parentRemote(const std::string &path) {
    std::string p = normalizeRemote(path);
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const std::size_t slash = p.rfind('/');
    if (slash == std::string::npos || slash == 0)
        return "/";
    return p.substr(0, slash);
}

std::string baseNameRemote(const std::string &path) {
    std::string p = path;
    while (!p.empty() && (p.back() == '/' || p.back() == '\\'))
        p.pop_back();
    const std::size_t slash = p.find_last_of("/\\");
    if (slash == std::string::npos)
        return p;
    return p.substr(slash + 1);
}

std::string shellQuote(const std::string &word) {
    std::string out;
    out.reserve(word.size() + 2);
    out.push_back('\'');
    for (char c : word) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace prosftp
