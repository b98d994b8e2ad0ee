// Error taxonomy shared by the session, the directory model and the
// transfer engine.
#pragma once
#include <string>
#include <utility>

namespace prosftp {

enum class ErrorCode {
    None,
    NotConnected,
    ConnectFailed,
    Cancelled,
    RemoteCommandFailed,
    LocalIOFailed,
    RemoteIOFailed,
    InvalidSelection,
    JobInFlight
};

inline const char *errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "None";
    case ErrorCode::NotConnected:
        return "NotConnected";
    case ErrorCode::ConnectFailed:
        return "ConnectFailed";
    case ErrorCode::Cancelled:
        return "Cancelled";
    case ErrorCode::RemoteCommandFailed:
        return "RemoteCommandFailed";
    case ErrorCode::LocalIOFailed:
        return "LocalIOFailed";
    case ErrorCode::RemoteIOFailed:
        return "RemoteIOFailed";
    case ErrorCode::InvalidSelection:
        return "InvalidSelection";
    case ErrorCode::JobInFlight:
        return "JobInFlight";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    bool ok() const { return code == ErrorCode::None; }

    void set(ErrorCode c, std::string msg) {
        code = c;
        message = std::move(msg);
    }

    void clear() {
        code = ErrorCode::None;
        message.clear();
    }
};

} // namespace prosftp
