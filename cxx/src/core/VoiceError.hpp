/**
 * @file VoiceError.hpp
 * @brief Tagged error type raised by the voice core.
 */

#ifndef BLABBER_VOICE_ERROR_HPP
#define BLABBER_VOICE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blabber {

enum class ErrorKind {
    Permission,      // invoker or bot lacks a channel permission
    NotConnected,    // operation needs a session that is absent
    InvalidRequest,  // invoker is not in a voice channel
    Validation,      // message fails content policy
    QueueFull,       // audio source backlog at capacity
    Connection,      // connect/move/disconnect failed in the transport
    Backend          // any other backend failure (play)
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Permission:     return "Permission";
        case ErrorKind::NotConnected:   return "NotConnected";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::Validation:     return "Validation";
        case ErrorKind::QueueFull:      return "QueueFull";
        case ErrorKind::Connection:     return "Connection";
        case ErrorKind::Backend:        return "Backend";
    }
    return "Unknown";
}

/**
 * @brief Errors raised while establishing or moving a voice connection.
 *
 * The command surface formats these as connect failures even when they
 * surface from a say invocation.
 */
inline bool is_connect_error(ErrorKind kind) {
    return kind == ErrorKind::Permission || kind == ErrorKind::Connection;
}

/**
 * @brief Single exception type for the core; callers branch on kind().
 */
class VoiceError : public std::runtime_error {
public:
    VoiceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace blabber

#endif // BLABBER_VOICE_ERROR_HPP
