#include "SettingsStore.hpp"
#include <fstream>
#include <iostream>

namespace blabber {

void to_json(json& j, const BotConfig& c) {
    j = json{
        {"version", c.version},
        {"settings", {
            {"queue_capacity", c.queue_capacity},
            {"max_message_length", c.max_message_length},
            {"synthesis_workers", c.synthesis_workers},
            {"frame_interval_ms", c.frame_interval_ms}
        }},
        {"default_voice", c.default_voice},
        {"voices", c.voices}
    };
}

void from_json(const json& j, BotConfig& c) {
    c.version = j.value("version", c.version);
    if (j.contains("settings")) {
        const auto& s = j.at("settings");
        c.queue_capacity = s.value("queue_capacity", c.queue_capacity);
        c.max_message_length = s.value("max_message_length", c.max_message_length);
        c.synthesis_workers = s.value("synthesis_workers", c.synthesis_workers);
        c.frame_interval_ms = s.value("frame_interval_ms", c.frame_interval_ms);
    }
    c.default_voice = j.value("default_voice", c.default_voice);
    if (j.contains("voices")) {
        c.voices = j.at("voices").get<std::map<std::string, VoiceProfile>>();
    }
}

bool SettingsStore::deserialize(BotConfig& config, const std::string& data) {
    try {
        json j = json::parse(data);
        BotConfig parsed = config;
        from_json(j, parsed);
        config = parsed;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[SettingsStore] Invalid config: " << e.what() << std::endl;
        return false;
    }
}

bool SettingsStore::save_to_file(const BotConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SettingsStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool SettingsStore::load_from_file(BotConfig& config, const std::string& path) {
    std::cout << "[SettingsStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SettingsStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    bool success = deserialize(config, content);
    if (success) {
        std::cout << "[SettingsStore] Loaded " << config.voices.size() << " voice(s)" << std::endl;
    } else {
        std::cerr << "[SettingsStore] Failed to deserialize config from: " << path << std::endl;
    }
    return success;
}

void SettingsStore::apply(const BotConfig& config, BotSettings& settings, VoiceProfileRegistry& voices) {
    settings.queue_capacity = config.queue_capacity;
    settings.max_message_length = config.max_message_length;
    settings.synthesis_workers = config.synthesis_workers;
    settings.frame_interval_ms = config.frame_interval_ms;

    for (const auto& [alias, profile] : config.voices) {
        voices.add_voice(alias, profile);
    }
    if (!voices.set_default_alias(config.default_voice)) {
        std::cerr << "[SettingsStore] Default voice '" << config.default_voice
                  << "' is not in the catalog; keeping '" << voices.default_alias() << "'" << std::endl;
    }
}

} // namespace blabber
