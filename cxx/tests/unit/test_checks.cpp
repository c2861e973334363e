#include <gtest/gtest.h>
#include "Checks.hpp"
#include "TestHelper.hpp"
#include <functional>

using namespace blabber;
using test::FakeVoiceGateway;

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const VoiceError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected VoiceError";
    return ErrorKind::Backend;
}

} // namespace

class PermissionPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        session.attach(gateway.connect(session.guild(), general));
    }

    GuildPermissionPolicy policy;
    FakeVoiceGateway gateway;
    VoiceSession session{42};
    VoiceChannel general = test::channel(10, "General");
    VoiceChannel music = test::channel(11, "Music");
};

TEST_F(PermissionPolicyTest, SameChannelMayDisconnect) {
    auto ctx = test::context_in(general);
    ctx.bot_channel_listeners = 3;
    EXPECT_NO_THROW(policy.can_disconnect(ctx, session));
}

TEST_F(PermissionPolicyTest, EmptyBotChannelMayBeTaken) {
    auto ctx = test::context_in(music);
    ctx.bot_channel_listeners = 0;
    EXPECT_NO_THROW(policy.can_disconnect(ctx, session));
}

TEST_F(PermissionPolicyTest, BusyBotChannelNeedsMoveMembers) {
    auto ctx = test::context_in(music);
    ctx.bot_channel_listeners = 2;
    EXPECT_EQ(kind_of([&] { policy.can_disconnect(ctx, session); }), ErrorKind::Permission);

    ctx.author_permissions = PERM_MOVE_MEMBERS;
    EXPECT_NO_THROW(policy.can_disconnect(ctx, session));

    ctx.author_permissions = PERM_ADMINISTRATOR;
    EXPECT_NO_THROW(policy.can_disconnect(ctx, session));
}

TEST_F(PermissionPolicyTest, MissingPermissionsAreNamed) {
    auto ctx = test::context_in(music);
    ctx.bot_permissions = PERM_NONE;
    try {
        policy.has_required_permissions(ctx, music);
        FAIL() << "expected VoiceError";
    } catch (const VoiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Permission);
        std::string what = e.what();
        EXPECT_NE(what.find("Connect"), std::string::npos);
        EXPECT_NE(what.find("Speak"), std::string::npos);
    }

    ctx.bot_permissions = PERM_CONNECT;
    try {
        policy.has_required_permissions(ctx, music);
        FAIL() << "expected VoiceError";
    } catch (const VoiceError& e) {
        std::string what = e.what();
        EXPECT_EQ(what.find("Connect"), std::string::npos);
        EXPECT_NE(what.find("Speak"), std::string::npos);
    }
}

TEST_F(PermissionPolicyTest, FullChannelRejectedUnlessBotCanMoveMembers) {
    auto ctx = test::context_in(music);
    music.user_limit = 2;
    music.member_count = 2;
    EXPECT_EQ(kind_of([&] { policy.has_required_permissions(ctx, music); }), ErrorKind::Permission);

    ctx.bot_permissions |= PERM_MOVE_MEMBERS;
    EXPECT_NO_THROW(policy.has_required_permissions(ctx, music));
}

TEST(MessagePolicyTest, InvokerMustBeInVoice) {
    MessagePolicy policy(600);
    EXPECT_TRUE(policy.invoker_is_connected(test::context_in(test::channel(1, "A"))));
    EXPECT_FALSE(policy.invoker_is_connected(test::context_without_voice()));
}

TEST(MessagePolicyTest, BlankAndOverlongMessagesRejected) {
    MessagePolicy policy(10);
    auto ctx = test::context_in(test::channel(1, "A"));

    EXPECT_NO_THROW(policy.message_is_valid(ctx, "hello"));
    EXPECT_NO_THROW(policy.message_is_valid(ctx, std::string(10, 'a')));
    EXPECT_EQ(kind_of([&] { policy.message_is_valid(ctx, ""); }), ErrorKind::Validation);
    EXPECT_EQ(kind_of([&] { policy.message_is_valid(ctx, " \t\n"); }), ErrorKind::Validation);
    EXPECT_EQ(kind_of([&] { policy.message_is_valid(ctx, std::string(11, 'a')); }), ErrorKind::Validation);
}

TEST(MessagePolicyTest, LengthCountsCharactersNotBytes) {
    MessagePolicy policy(600);
    auto ctx = test::context_in(test::channel(1, "A"));

    std::string hiragana_a = "\xE3\x81\x82";
    std::string short_message;
    for (int i = 0; i < 250; ++i) short_message += hiragana_a;
    EXPECT_NO_THROW(policy.message_is_valid(ctx, short_message));

    std::string long_message;
    for (int i = 0; i < 601; ++i) long_message += hiragana_a;
    try {
        policy.message_is_valid(ctx, long_message);
        FAIL() << "expected Validation";
    } catch (const VoiceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        EXPECT_STREQ(e.what(), "Message is too long (601/600 characters)");
    }
}
