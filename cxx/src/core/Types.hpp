/**
 * @file Types.hpp
 * @brief Identifiers and per-invocation context shared by the voice core.
 */

#ifndef BLABBER_TYPES_HPP
#define BLABBER_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace blabber {

using GuildId = uint64_t;
using ChannelId = uint64_t;
using UserId = uint64_t;

/**
 * @brief Channel permission bits relevant to voice operations.
 */
enum Permission : uint32_t {
    PERM_NONE          = 0,
    PERM_CONNECT       = 1u << 0,
    PERM_SPEAK         = 1u << 1,
    PERM_MOVE_MEMBERS  = 1u << 2,
    PERM_ADMINISTRATOR = 1u << 3
};

using Permissions = uint32_t;

inline bool has_permission(Permissions set, Permission p) {
    return (set & p) == p;
}

/**
 * @brief A guild voice channel as seen by the bot.
 */
struct VoiceChannel {
    ChannelId id = 0;
    std::string name;
    int user_limit = 0;   // 0 = unlimited
    int member_count = 0;

    bool operator==(const VoiceChannel& other) const { return id == other.id; }
    bool operator!=(const VoiceChannel& other) const { return id != other.id; }
};

struct Member {
    UserId id = 0;
    std::string name;
};

/**
 * @brief Everything the command framework knows about one invocation.
 *
 * Filled by the host for every connect/disconnect/say call. The core never
 * reaches back into the framework for more state.
 */
struct CommandContext {
    GuildId guild = 0;
    Member author;
    ChannelId text_channel = 0;

    // Voice channel the author is currently in, if any.
    std::optional<VoiceChannel> author_voice;

    Permissions author_permissions = PERM_NONE;

    // Bot permissions in the author's voice channel.
    Permissions bot_permissions = PERM_NONE;

    // Humans (excluding the author) in the bot's current voice channel.
    int bot_channel_listeners = 0;
};

} // namespace blabber

#endif // BLABBER_TYPES_HPP
