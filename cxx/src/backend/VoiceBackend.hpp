/**
 * @file VoiceBackend.hpp
 * @brief Abstract interface to the voice service transport.
 * 
 * Transport code (gateway websockets, RTP, encryption) stays behind this
 * boundary; the core only sees per-guild clients.
 */

#ifndef BLABBER_VOICE_BACKEND_HPP
#define BLABBER_VOICE_BACKEND_HPP

#include "Types.hpp"
#include "AudioSource.hpp"
#include <memory>

namespace blabber::backend {

/**
 * @brief The bot's live connection to one voice channel of one guild.
 * 
 * Transport failures are reported as VoiceError with ErrorKind::Connection
 * (connect, move, disconnect) or ErrorKind::Backend (play).
 */
class VoiceClient {
public:
    virtual ~VoiceClient() = default;

    /**
     * @brief The channel the client is currently connected to.
     */
    virtual const VoiceChannel& channel() const = 0;

    /**
     * @brief Move the connection to another channel of the same guild.
     * 
     * On failure the client stays in its current channel.
     */
    virtual void move_to(const VoiceChannel& channel) = 0;

    /**
     * @brief Close the connection; stops any player first.
     */
    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    /**
     * @brief True while a player is streaming a source.
     */
    virtual bool is_playing() const = 0;

    /**
     * @brief Start a player reading 20 ms frames from the source.
     */
    virtual void play(std::shared_ptr<AudioSource> source) = 0;

    /**
     * @brief Stop the player, if any. The source itself is left intact.
     */
    virtual void stop() = 0;
};

/**
 * @brief Factory for voice connections.
 */
class VoiceGateway {
public:
    virtual ~VoiceGateway() = default;

    /**
     * @brief Open a connection to a voice channel.
     * 
     * @return A connected client (never null).
     */
    virtual std::unique_ptr<VoiceClient> connect(GuildId guild, const VoiceChannel& channel) = 0;
};

} // namespace blabber::backend

#endif // BLABBER_VOICE_BACKEND_HPP
