/**
 * @file VoiceProfileRegistry.hpp
 * @brief Voice catalog and per-(user, channel) voice assignments.
 */

#ifndef BLABBER_VOICE_PROFILE_REGISTRY_HPP
#define BLABBER_VOICE_PROFILE_REGISTRY_HPP

#include "Types.hpp"
#include "VoiceProfile.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace blabber {

/**
 * @brief Resolves which voice an invoker speaks with in a text channel.
 * 
 * Assignments live in memory only. Lookups that miss fall back to the
 * default alias, which always exists in the catalog.
 */
class VoiceProfileRegistry {
public:
    explicit VoiceProfileRegistry(std::string default_alias = "default");

    /**
     * @brief Add or replace a catalog entry.
     */
    void add_voice(const std::string& alias, const VoiceProfile& profile);

    bool has_voice(const std::string& alias) const;

    /**
     * @brief Switch the fallback alias.
     * @return false if the alias is not in the catalog.
     */
    bool set_default_alias(const std::string& alias);
    std::string default_alias() const;

    /**
     * @brief Pick a voice for a user in a text channel.
     * @throws VoiceError (Validation) for an unknown alias.
     */
    void assign(UserId user, ChannelId channel, const std::string& alias);
    void unassign(UserId user, ChannelId channel);

    std::string alias_for(UserId user, ChannelId channel) const;
    VoiceProfile resolve(UserId user, ChannelId channel) const;

    std::vector<std::string> aliases() const;

private:
    using Key = std::pair<UserId, ChannelId>;

    mutable std::mutex mutex_;
    std::string default_alias_;
    std::map<std::string, VoiceProfile> voices_;
    std::map<Key, std::string> assignments_;
};

} // namespace blabber

#endif // BLABBER_VOICE_PROFILE_REGISTRY_HPP
