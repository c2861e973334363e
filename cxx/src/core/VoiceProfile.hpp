/**
 * @file VoiceProfile.hpp
 * @brief Named set of speech synthesis parameters.
 */

#ifndef BLABBER_VOICE_PROFILE_HPP
#define BLABBER_VOICE_PROFILE_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace blabber {

using json = nlohmann::json;

struct VoiceProfile {
    std::string language_code = "en-US";
    std::string name = "en-US-Standard-C";
    std::string gender = "NEUTRAL";
    double speaking_rate = 1.0;
    double pitch = 0.0;

    bool operator==(const VoiceProfile& other) const {
        return language_code == other.language_code && name == other.name
            && gender == other.gender && speaking_rate == other.speaking_rate
            && pitch == other.pitch;
    }
};

inline void to_json(json& j, const VoiceProfile& v) {
    j = json{
        {"language_code", v.language_code},
        {"name", v.name},
        {"gender", v.gender},
        {"speaking_rate", v.speaking_rate},
        {"pitch", v.pitch}
    };
}

// Missing keys keep their defaults so catalogs can list only what differs.
inline void from_json(const json& j, VoiceProfile& v) {
    VoiceProfile defaults;
    v.language_code = j.value("language_code", defaults.language_code);
    v.name = j.value("name", defaults.name);
    v.gender = j.value("gender", defaults.gender);
    v.speaking_rate = j.value("speaking_rate", defaults.speaking_rate);
    v.pitch = j.value("pitch", defaults.pitch);
}

} // namespace blabber

#endif // BLABBER_VOICE_PROFILE_HPP
