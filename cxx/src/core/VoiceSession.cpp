#include "VoiceSession.hpp"
#include "VoiceError.hpp"

namespace blabber {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Absent:           return "Absent";
        case SessionState::ConnectedIdle:    return "ConnectedIdle";
        case SessionState::ConnectedPlaying: return "ConnectedPlaying";
    }
    return "Unknown";
}

const VoiceChannel* VoiceSession::channel() const {
    return client_ ? &client_->channel() : nullptr;
}

bool VoiceSession::is_playing() const {
    return client_ && client_->is_playing();
}

SessionState VoiceSession::state() const {
    if (!client_) return SessionState::Absent;
    return client_->is_playing() ? SessionState::ConnectedPlaying : SessionState::ConnectedIdle;
}

void VoiceSession::attach(std::unique_ptr<backend::VoiceClient> client) {
    client_ = std::move(client);
    source_.reset();
}

void VoiceSession::start_player(std::shared_ptr<AudioSource> source) {
    if (!client_) {
        throw VoiceError(ErrorKind::NotConnected, "Blabber is not connected to any voice channel");
    }
    // Record only after the backend accepted the source.
    client_->play(source);
    source_ = std::move(source);
}

void VoiceSession::release_player() {
    if (source_) {
        source_->clear();
    }
    if (client_) {
        client_->stop();
    }
    source_.reset();
}

void VoiceSession::reset() {
    if (source_) {
        source_->clear();
    }
    source_.reset();
    client_.reset();
}

} // namespace blabber
