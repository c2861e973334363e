#include "VoiceProfileRegistry.hpp"
#include "VoiceError.hpp"

namespace blabber {

VoiceProfileRegistry::VoiceProfileRegistry(std::string default_alias)
    : default_alias_(std::move(default_alias))
{
    voices_[default_alias_] = VoiceProfile{};
}

void VoiceProfileRegistry::add_voice(const std::string& alias, const VoiceProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    voices_[alias] = profile;
}

bool VoiceProfileRegistry::has_voice(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.count(alias) > 0;
}

bool VoiceProfileRegistry::set_default_alias(const std::string& alias) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (voices_.count(alias) == 0) return false;
    default_alias_ = alias;
    return true;
}

std::string VoiceProfileRegistry::default_alias() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_alias_;
}

void VoiceProfileRegistry::assign(UserId user, ChannelId channel, const std::string& alias) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (voices_.count(alias) == 0) {
        throw VoiceError(ErrorKind::Validation, "Unknown voice `" + alias + "`");
    }
    assignments_[{user, channel}] = alias;
}

void VoiceProfileRegistry::unassign(UserId user, ChannelId channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    assignments_.erase({user, channel});
}

std::string VoiceProfileRegistry::alias_for(UserId user, ChannelId channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assignments_.find({user, channel});
    return it == assignments_.end() ? default_alias_ : it->second;
}

VoiceProfile VoiceProfileRegistry::resolve(UserId user, ChannelId channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto assigned = assignments_.find({user, channel});
    const std::string& alias = assigned == assignments_.end() ? default_alias_ : assigned->second;

    auto voice = voices_.find(alias);
    if (voice == voices_.end()) {
        // Catalog was reloaded without this alias
        voice = voices_.find(default_alias_);
    }
    return voice == voices_.end() ? VoiceProfile{} : voice->second;
}

std::vector<std::string> VoiceProfileRegistry::aliases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(voices_.size());
    for (const auto& entry : voices_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace blabber
