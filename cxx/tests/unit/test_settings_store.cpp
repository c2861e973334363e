#include <gtest/gtest.h>
#include "SettingsStore.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace blabber;

namespace {

BotConfig sample_config() {
    BotConfig config;
    config.queue_capacity = 8;
    config.max_message_length = 120;
    config.synthesis_workers = 3;
    config.frame_interval_ms = 10;

    VoiceProfile chipmunk;
    chipmunk.speaking_rate = 1.8;
    chipmunk.pitch = 12.0;
    config.voices["chipmunk"] = chipmunk;
    config.default_voice = "chipmunk";
    return config;
}

} // namespace

TEST(SettingsStoreTest, SerializeThenDeserialize) {
    BotConfig original = sample_config();
    std::string text = SettingsStore::serialize(original);

    BotConfig loaded;
    ASSERT_TRUE(SettingsStore::deserialize(loaded, text));
    EXPECT_EQ(loaded.queue_capacity, 8u);
    EXPECT_EQ(loaded.max_message_length, 120u);
    EXPECT_EQ(loaded.synthesis_workers, 3);
    EXPECT_EQ(loaded.frame_interval_ms, 10);
    EXPECT_EQ(loaded.default_voice, "chipmunk");
    ASSERT_EQ(loaded.voices.count("chipmunk"), 1u);
    EXPECT_EQ(loaded.voices.at("chipmunk"), original.voices.at("chipmunk"));
}

TEST(SettingsStoreTest, MissingKeysKeepDefaults) {
    BotConfig config;
    ASSERT_TRUE(SettingsStore::deserialize(config, R"({"settings": {"queue_capacity": 4}})"));
    EXPECT_EQ(config.queue_capacity, 4u);
    EXPECT_EQ(config.max_message_length, 600u);
    EXPECT_EQ(config.default_voice, "default");
    EXPECT_TRUE(config.voices.empty());
}

TEST(SettingsStoreTest, PartialVoiceEntriesUseProfileDefaults) {
    BotConfig config;
    ASSERT_TRUE(SettingsStore::deserialize(config, R"({"voices": {"slow": {"speaking_rate": 0.5}}})"));
    ASSERT_EQ(config.voices.count("slow"), 1u);
    EXPECT_DOUBLE_EQ(config.voices.at("slow").speaking_rate, 0.5);
    EXPECT_EQ(config.voices.at("slow").language_code, "en-US");
}

TEST(SettingsStoreTest, InvalidJsonLeavesConfigUntouched) {
    BotConfig config = sample_config();
    EXPECT_FALSE(SettingsStore::deserialize(config, "{ not json"));
    EXPECT_EQ(config.queue_capacity, 8u);

    // Wrong type halfway through: nothing is applied.
    EXPECT_FALSE(SettingsStore::deserialize(config,
        R"({"default_voice": "x", "settings": {"queue_capacity": "lots"}})"));
    EXPECT_EQ(config.default_voice, "chipmunk");
    EXPECT_EQ(config.queue_capacity, 8u);
}

TEST(SettingsStoreTest, SaveAndLoadFile) {
    std::string path = (std::filesystem::temp_directory_path() / "blabber_settings_test.json").string();
    ASSERT_TRUE(SettingsStore::save_to_file(sample_config(), path));

    BotConfig loaded;
    ASSERT_TRUE(SettingsStore::load_from_file(loaded, path));
    EXPECT_EQ(loaded.queue_capacity, 8u);
    EXPECT_EQ(loaded.default_voice, "chipmunk");

    std::remove(path.c_str());
}

TEST(SettingsStoreTest, LoadMissingFileFails) {
    BotConfig config;
    EXPECT_FALSE(SettingsStore::load_from_file(config, "/nonexistent/blabber/config.json"));
    EXPECT_EQ(config.queue_capacity, 32u);
}

TEST(SettingsStoreTest, ApplyPublishesSettingsAndVoices) {
    BotSettings& settings = BotSettings::instance();
    size_t saved_capacity = settings.queue_capacity;
    size_t saved_length = settings.max_message_length;
    int saved_workers = settings.synthesis_workers;
    int saved_interval = settings.frame_interval_ms;

    VoiceProfileRegistry voices;
    SettingsStore::apply(sample_config(), settings, voices);

    EXPECT_EQ(settings.queue_capacity.load(), 8u);
    EXPECT_EQ(settings.max_message_length.load(), 120u);
    EXPECT_TRUE(voices.has_voice("chipmunk"));
    EXPECT_EQ(voices.default_alias(), "chipmunk");

    settings.queue_capacity = saved_capacity;
    settings.max_message_length = saved_length;
    settings.synthesis_workers = saved_workers;
    settings.frame_interval_ms = saved_interval;
}

TEST(SettingsStoreTest, ApplyKeepsDefaultWhenAliasUnknown) {
    BotConfig config;
    config.default_voice = "missing";

    BotSettings& settings = BotSettings::instance();
    VoiceProfileRegistry voices;
    SettingsStore::apply(config, settings, voices);
    EXPECT_EQ(voices.default_alias(), "default");
}
