/**
 * @file SessionRegistry.hpp
 * @brief Owns one VoiceSession per guild.
 */

#ifndef BLABBER_SESSION_REGISTRY_HPP
#define BLABBER_SESSION_REGISTRY_HPP

#include "VoiceSession.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace blabber {

/**
 * @brief Explicit guild -> session lookup.
 * 
 * The registry mutex only guards the map; session state is guarded by each
 * session's own lock, so guilds never contend with each other.
 */
class SessionRegistry {
public:
    /**
     * @brief Get the session record for a guild, creating an Absent one on first use.
     */
    std::shared_ptr<VoiceSession> session(GuildId guild);

    /**
     * @brief Look up without creating; null if the guild was never seen.
     */
    std::shared_ptr<VoiceSession> find(GuildId guild) const;

    size_t size() const;

    /**
     * @brief Number of sessions currently holding a connection.
     */
    size_t connected_count() const;

    /**
     * @brief Disconnect every guild. Backend failures are logged, not thrown.
     */
    void shutdown();

private:
    mutable std::mutex mutex_;
    std::unordered_map<GuildId, std::shared_ptr<VoiceSession>> sessions_;
};

} // namespace blabber

#endif // BLABBER_SESSION_REGISTRY_HPP
