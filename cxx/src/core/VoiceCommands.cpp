/**
 * @file VoiceCommands.cpp
 * @brief Reply formatting and error translation for voice commands.
 */

#include "VoiceCommands.hpp"
#include "Logger.hpp"
#include <iostream>

namespace blabber {

namespace {

CommandReply ok(std::string message, std::string reaction = {}) {
    return {true, std::move(message), std::move(reaction)};
}

CommandReply failed(std::string message) {
    return {false, std::move(message), {}};
}

void report(const char* command, const VoiceError& error) {
    log_messagef("CmdError", "%s: %s", command, to_string(error.kind()));
}

void report(const char* command, const std::exception& error) {
    std::cerr << "[VoiceCommands] Unexpected error in " << command << ": " << error.what() << std::endl;
    EventLogger::instance().log_message("CmdError", command);
}

} // namespace

VoiceCommands::VoiceCommands(SessionRegistry& sessions,
                             ConnectionCoordinator& coordinator,
                             SpeechDispatcher& dispatcher,
                             const RequestValidator& validator)
    : sessions_(sessions)
    , coordinator_(coordinator)
    , dispatcher_(dispatcher)
    , validator_(validator)
{
    command_map_ = {
        {"connect",    Command::Connect},
        {"c",          Command::Connect},
        {"disconnect", Command::Disconnect},
        {"dc",         Command::Disconnect},
        {"say",        Command::Say},
        {"s",          Command::Say}
    };
}

CommandReply VoiceCommands::connect(const CommandContext& ctx) {
    try {
        if (!validator_.invoker_is_connected(ctx)) {
            throw VoiceError(ErrorKind::InvalidRequest, "You must be connected to a voice channel");
        }

        auto session = sessions_.session(ctx.guild);
        ConnectResult result = coordinator_.connect_or_move(ctx, *session);

        if (result == ConnectResult::AlreadyPresent) {
            return ok(":information_source: **Blabber is already in this voice channel**");
        }
        return ok(":white_check_mark: **" + std::string(to_string(result)) + " to** `"
                  + ctx.author_voice->name + "`");
    } catch (const VoiceError& e) {
        report("connect", e);
        return connect_error(ctx, e.what());
    } catch (const std::exception& e) {
        report("connect", e);
        return connect_error(ctx, e.what());
    }
}

CommandReply VoiceCommands::disconnect(const CommandContext& ctx) {
    try {
        auto session = sessions_.session(ctx.guild);
        coordinator_.disconnect(ctx, *session);
        return ok(":white_check_mark: **Successfully disconnected**");
    } catch (const VoiceError& e) {
        if (e.kind() == ErrorKind::NotConnected) {
            return ok(":information_source: **Blabber is not connected to any voice channel**");
        }
        report("disconnect", e);
        return disconnect_error(e.what());
    } catch (const std::exception& e) {
        report("disconnect", e);
        return disconnect_error(e.what());
    }
}

CommandReply VoiceCommands::say(const CommandContext& ctx, const std::string& message) {
    try {
        auto session = sessions_.session(ctx.guild);
        dispatcher_.speak(ctx, message, *session);
        return ok("", SPEAK_REACTION);
    } catch (const VoiceError& e) {
        report("say", e);
        if (is_connect_error(e.kind())) {
            return connect_error(ctx, e.what());
        }
        return say_error(e.what());
    } catch (const std::exception& e) {
        report("say", e);
        return say_error(e.what());
    }
}

CommandReply VoiceCommands::dispatch(const std::string& command, const CommandContext& ctx, const std::string& args) {
    auto it = command_map_.find(command);
    if (it == command_map_.end()) {
        return failed(":x: **Unknown command** `" + command + "`");
    }

    switch (it->second) {
        case Command::Connect:    return connect(ctx);
        case Command::Disconnect: return disconnect(ctx);
        case Command::Say:        return say(ctx, args);
    }
    return failed(":x: **Unknown command** `" + command + "`");
}

CommandReply VoiceCommands::connect_error(const CommandContext& ctx, const std::string& detail) {
    // Worded after the state at report time: a failed move leaves the bot connected.
    auto session = sessions_.session(ctx.guild);
    bool connected;
    {
        auto lock = session->lock();
        connected = session->connected();
    }
    const char* operation = connected ? "move" : "connect";
    return failed(":x: **Unable to " + std::string(operation) + "**\n" + detail);
}

CommandReply VoiceCommands::disconnect_error(const std::string& detail) {
    return failed(":x: **Unable to disconnect**\n" + detail);
}

CommandReply VoiceCommands::say_error(const std::string& detail) {
    return failed(":x: **Unable to convert to speech**\n" + detail);
}

} // namespace blabber
