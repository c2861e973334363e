#include <gtest/gtest.h>
#include "VoiceCommands.hpp"
#include "TestHelper.hpp"

using namespace blabber;

class VoiceCommandsTest : public ::testing::Test {
protected:
    test::FakeVoiceGateway gateway;
    GuildPermissionPolicy permissions;
    MessagePolicy validator{40};
    VoiceProfileRegistry voices;
    SessionRegistry sessions;
    ConnectionCoordinator coordinator{gateway, permissions};
    SpeechDispatcher dispatcher{coordinator, validator, voices, []() {
        return std::shared_ptr<AudioSource>(std::make_shared<test::FakeAudioSource>());
    }};
    VoiceCommands commands{sessions, coordinator, dispatcher, validator};

    VoiceChannel general = test::channel(10, "General");
    VoiceChannel music = test::channel(11, "Music");
};

TEST_F(VoiceCommandsTest, ConnectReplies) {
    auto reply = commands.connect(test::context_in(general));
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.message, ":white_check_mark: **Connected to** `General`");

    reply = commands.connect(test::context_in(general));
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.message, ":information_source: **Blabber is already in this voice channel**");

    reply = commands.connect(test::context_in(music));
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.message, ":white_check_mark: **Moved to** `Music`");
}

TEST_F(VoiceCommandsTest, ConnectOutsideVoiceFails) {
    auto reply = commands.connect(test::context_without_voice());
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message.rfind(":x: **Unable to connect**\n", 0), 0u);
    EXPECT_EQ(gateway.log->backend_calls(), 0);
}

TEST_F(VoiceCommandsTest, ConnectFailureNamesTheBackendError) {
    gateway.log->fail_connect = true;
    auto reply = commands.connect(test::context_in(general));
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message, ":x: **Unable to connect**\nTimed out connecting");
}

TEST_F(VoiceCommandsTest, DisconnectReplies) {
    // Informational, not an error.
    auto reply = commands.disconnect(test::context_in(general));
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.message, ":information_source: **Blabber is not connected to any voice channel**");
    EXPECT_EQ(gateway.log->backend_calls(), 0);

    commands.connect(test::context_in(general));
    reply = commands.disconnect(test::context_in(general));
    EXPECT_TRUE(reply.success);
    EXPECT_EQ(reply.message, ":white_check_mark: **Successfully disconnected**");
    EXPECT_EQ(sessions.connected_count(), 0u);
}

TEST_F(VoiceCommandsTest, DisconnectFailureIsReported) {
    commands.connect(test::context_in(general));
    gateway.log->fail_disconnect = true;

    auto reply = commands.disconnect(test::context_in(general));
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message, ":x: **Unable to disconnect**\nTimed out disconnecting");
    EXPECT_EQ(sessions.connected_count(), 1u);
}

TEST_F(VoiceCommandsTest, SayAnswersWithAReaction) {
    auto reply = commands.say(test::context_in(general), "hello there");
    EXPECT_TRUE(reply.success);
    EXPECT_TRUE(reply.message.empty());
    EXPECT_EQ(reply.reaction, VoiceCommands::SPEAK_REACTION);
    EXPECT_EQ(sessions.session(42)->state(), SessionState::ConnectedPlaying);
}

TEST_F(VoiceCommandsTest, SayPermissionFailureIsWordedAsConnectOrMove) {
    auto blocked = test::context_in(general);
    blocked.bot_permissions = PERM_NONE;

    auto reply = commands.say(blocked, "hi");
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message.rfind(":x: **Unable to connect**\n", 0), 0u);

    commands.connect(test::context_in(general));
    auto outsider = test::context_in(music, 2);
    outsider.bot_channel_listeners = 2;

    reply = commands.say(outsider, "hi");
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message,
              ":x: **Unable to move**\nBlabber is being used in `General`; you need the Move Members permission to take it");
}

TEST_F(VoiceCommandsTest, SayValidationFailure) {
    auto reply = commands.say(test::context_in(general), "");
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message, ":x: **Unable to convert to speech**\nMessage is empty");
    EXPECT_TRUE(reply.reaction.empty());
}

TEST_F(VoiceCommandsTest, DispatchHonoursAliases) {
    EXPECT_TRUE(commands.dispatch("c", test::context_in(general), "").success);
    EXPECT_EQ(commands.dispatch("s", test::context_in(general), "hey").reaction, VoiceCommands::SPEAK_REACTION);
    EXPECT_EQ(commands.dispatch("dc", test::context_in(general), "").message,
              ":white_check_mark: **Successfully disconnected**");
    EXPECT_EQ(commands.dispatch("connect", test::context_in(general), "").message,
              ":white_check_mark: **Connected to** `General`");
    EXPECT_TRUE(commands.dispatch("say", test::context_in(general), "hey").success);
    EXPECT_TRUE(commands.dispatch("disconnect", test::context_in(general), "").success);
}

TEST_F(VoiceCommandsTest, UnknownCommand) {
    auto reply = commands.dispatch("sing", test::context_in(general), "");
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.message, ":x: **Unknown command** `sing`");
}
