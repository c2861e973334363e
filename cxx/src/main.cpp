/**
 * @file main.cpp
 * @brief Scripted walk through the voice commands on the loopback backend.
 * 
 * Usage: blabber_demo [config.json]
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "core/BotSettings.hpp"
#include "core/Checks.hpp"
#include "core/ConnectionCoordinator.hpp"
#include "core/Logger.hpp"
#include "core/SessionRegistry.hpp"
#include "core/SettingsStore.hpp"
#include "core/SpeechDispatcher.hpp"
#include "core/SynthesisPool.hpp"
#include "core/TtsAudioSource.hpp"
#include "core/VoiceCommands.hpp"
#include "core/VoiceProfileRegistry.hpp"
#include "backend/loopback/LoopbackVoiceGateway.hpp"

using namespace blabber;

static void print_reply(const std::string& who, const std::string& command, const CommandReply& reply) {
    std::cout << who << " > " << command << std::endl;
    if (!reply.message.empty()) {
        std::cout << "    " << reply.message << std::endl;
    }
    if (!reply.reaction.empty()) {
        std::cout << "    (reacted " << reply.reaction << ")" << std::endl;
    }
}

static CommandContext make_context(UserId user, const std::string& name, const VoiceChannel& channel) {
    CommandContext ctx;
    ctx.guild = 1;
    ctx.author = {user, name};
    ctx.text_channel = 100;
    ctx.author_voice = channel;
    ctx.author_permissions = PERM_CONNECT | PERM_SPEAK;
    ctx.bot_permissions = PERM_CONNECT | PERM_SPEAK;
    return ctx;
}

int main(int argc, char** argv) {
    // Telemetry goes to stderr as it is produced.
    EventLogDrain telemetry(std::clog, std::chrono::milliseconds(250));

    auto& settings = BotSettings::instance();
    VoiceProfileRegistry voices;

    if (argc > 1) {
        BotConfig config;
        if (!SettingsStore::load_from_file(config, argv[1])) {
            return 1;
        }
        SettingsStore::apply(config, settings, voices);
    }

    backend::LoopbackVoiceGateway gateway(std::chrono::milliseconds(settings.frame_interval_ms.load()));
    SynthesisPool pool(std::make_shared<backend::SilentSynthesizer>(), settings.synthesis_workers.load());

    GuildPermissionPolicy permissions;
    MessagePolicy validator(settings.max_message_length.load());
    SessionRegistry sessions;
    ConnectionCoordinator coordinator(gateway, permissions);
    size_t capacity = settings.queue_capacity.load();
    SpeechDispatcher dispatcher(coordinator, validator, voices, [&pool, capacity]() {
        return std::make_shared<TtsAudioSource>(pool, capacity);
    });
    VoiceCommands commands(sessions, coordinator, dispatcher, validator);

    VoiceChannel general{10, "General"};
    VoiceChannel music{11, "Music"};

    auto alice = make_context(1001, "alice", general);
    auto bob = make_context(1002, "bob", music);
    bob.bot_channel_listeners = 1;

    std::cout << "=== 1. say while disconnected ===" << std::endl;
    print_reply("alice", "say hello", commands.dispatch("say", alice, "hello"));
    print_reply("alice", "s how is everyone", commands.dispatch("s", alice, "how is everyone"));

    std::cout << "\n=== 2. connect to the same channel ===" << std::endl;
    print_reply("alice", "connect", commands.dispatch("connect", alice, ""));

    std::cout << "\n=== 3. move without permission ===" << std::endl;
    print_reply("bob", "connect", commands.dispatch("c", bob, ""));

    std::cout << "\n=== 4. move with permission ===" << std::endl;
    bob.author_permissions |= PERM_MOVE_MEMBERS;
    print_reply("bob", "connect", commands.dispatch("c", bob, ""));
    print_reply("bob", "say we moved", commands.dispatch("say", bob, "we moved"));

    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    std::cout << "\n=== 5. disconnect ===" << std::endl;
    print_reply("bob", "dc", commands.dispatch("dc", bob, ""));
    print_reply("bob", "dc", commands.dispatch("dc", bob, ""));

    std::cout << "\nSpoken in guild 1:" << std::endl;
    for (const auto& text : gateway.transcript(1)) {
        std::cout << "    " << text << std::endl;
    }
    std::cout << "Frames played: " << gateway.frames_played() << std::endl;

    sessions.shutdown();
    pool.shutdown();

    telemetry.stop();
    return 0;
}
