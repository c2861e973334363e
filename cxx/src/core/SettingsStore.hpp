/**
 * @file SettingsStore.hpp
 * @brief Human-readable JSON configuration for the bot's voice core.
 */

#ifndef BLABBER_SETTINGS_STORE_HPP
#define BLABBER_SETTINGS_STORE_HPP

#include "BotSettings.hpp"
#include "VoiceProfile.hpp"
#include "VoiceProfileRegistry.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace blabber {

using json = nlohmann::json;

/**
 * @brief Plain snapshot of everything read from the config file.
 */
struct BotConfig {
    int version = 1;
    size_t queue_capacity = 32;
    size_t max_message_length = 600;
    int synthesis_workers = 2;
    int frame_interval_ms = 20;
    std::string default_voice = "default";
    std::map<std::string, VoiceProfile> voices;
};

void to_json(json& j, const BotConfig& c);

// Missing keys keep the values already in `c`.
void from_json(const json& j, BotConfig& c);

/**
 * @brief Manages saving and loading of BotConfig.
 */
class SettingsStore {
public:
    static bool save_to_file(const BotConfig& config, const std::string& path);
    static bool load_from_file(BotConfig& config, const std::string& path);

    /**
     * @brief Convert BotConfig to a JSON string.
     */
    static std::string serialize(const BotConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Load BotConfig from a JSON string.
     */
    static bool deserialize(BotConfig& config, const std::string& data);

    /**
     * @brief Publish a loaded config to the live settings and voice catalog.
     */
    static void apply(const BotConfig& config, BotSettings& settings, VoiceProfileRegistry& voices);
};

} // namespace blabber

#endif // BLABBER_SETTINGS_STORE_HPP
