/**
 * @file VoiceSession.hpp
 * @brief Per-guild record of the bot's voice connection and playback.
 */

#ifndef BLABBER_VOICE_SESSION_HPP
#define BLABBER_VOICE_SESSION_HPP

#include "Types.hpp"
#include "AudioSource.hpp"
#include "VoiceBackend.hpp"
#include <memory>
#include <mutex>

namespace blabber {

enum class SessionState {
    Absent,
    ConnectedIdle,
    ConnectedPlaying
};

const char* to_string(SessionState state);

/**
 * @brief One guild's voice session.
 * 
 * All mutators assume the caller holds the lock returned by lock(); the
 * coordinator and dispatcher take it for the duration of one operation.
 * Invariant: a player (source()) is only recorded while a client is attached.
 */
class VoiceSession {
public:
    explicit VoiceSession(GuildId guild) : guild_(guild) {}

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    GuildId guild() const { return guild_; }

    /**
     * @brief Acquire the per-session serialization scope.
     */
    std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

    bool connected() const { return client_ != nullptr; }
    const VoiceChannel* channel() const;
    backend::VoiceClient* client() { return client_.get(); }

    bool has_player() const { return source_ != nullptr; }
    const std::shared_ptr<AudioSource>& source() const { return source_; }
    bool is_playing() const;

    SessionState state() const;

    // Mutators (lock held)
    void attach(std::unique_ptr<backend::VoiceClient> client);

    /**
     * @brief Start the client playing `source` and record it as the player.
     */
    void start_player(std::shared_ptr<AudioSource> source);

    /**
     * @brief Clear the player's source and stop it; the client stays attached.
     */
    void release_player();

    /**
     * @brief Drop the player and client without touching the backend.
     */
    void reset();

private:
    GuildId guild_;
    std::mutex mutex_;
    std::unique_ptr<backend::VoiceClient> client_;
    std::shared_ptr<AudioSource> source_;
};

} // namespace blabber

#endif // BLABBER_VOICE_SESSION_HPP
