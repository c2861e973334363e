/**
 * @file ConnectionCoordinator.hpp
 * @brief Decides between connecting, moving or staying put.
 */

#ifndef BLABBER_CONNECTION_COORDINATOR_HPP
#define BLABBER_CONNECTION_COORDINATOR_HPP

#include "Checks.hpp"
#include "VoiceBackend.hpp"
#include "VoiceSession.hpp"
#include <mutex>

namespace blabber {

enum class ConnectResult {
    Connected,
    Moved,
    AlreadyPresent
};

const char* to_string(ConnectResult result);

/**
 * @brief Owns the session state machine for connect, move and disconnect.
 * 
 *   Absent --connect--> ConnectedIdle
 *   ConnectedIdle / ConnectedPlaying --move--> ConnectedIdle
 *   ConnectedIdle / ConnectedPlaying --disconnect--> Absent
 * 
 * Every check runs before the first mutation. A failed backend call leaves
 * the session on its previous channel.
 */
class ConnectionCoordinator {
public:
    ConnectionCoordinator(backend::VoiceGateway& gateway, const PermissionPolicy& permissions);

    /**
     * @brief Bring the bot to the invoker's voice channel.
     * 
     * Takes the session lock for the whole operation.
     * @throws VoiceError InvalidRequest if the invoker is not in a voice channel.
     */
    ConnectResult connect_or_move(const CommandContext& ctx, VoiceSession& session);

    /**
     * @brief Same as connect_or_move, for callers already holding the session lock.
     */
    ConnectResult connect_or_move_locked(const CommandContext& ctx, const VoiceChannel& target,
                                         VoiceSession& session,
                                         const std::unique_lock<std::mutex>& held);

    /**
     * @brief Leave the current voice channel, releasing player and source.
     * @throws VoiceError NotConnected if the session is absent.
     */
    void disconnect(const CommandContext& ctx, VoiceSession& session);

private:
    backend::VoiceGateway& gateway_;
    const PermissionPolicy& permissions_;
};

} // namespace blabber

#endif // BLABBER_CONNECTION_COORDINATOR_HPP
