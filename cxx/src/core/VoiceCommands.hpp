/**
 * @file VoiceCommands.hpp
 * @brief connect / disconnect / say entry points and their user-facing replies.
 */

#ifndef BLABBER_VOICE_COMMANDS_HPP
#define BLABBER_VOICE_COMMANDS_HPP

#include "Checks.hpp"
#include "ConnectionCoordinator.hpp"
#include "SessionRegistry.hpp"
#include "SpeechDispatcher.hpp"
#include "VoiceError.hpp"
#include <string>
#include <unordered_map>

namespace blabber {

/**
 * @brief What the host should post back to the invoker.
 * 
 * A successful say answers with a reaction instead of text.
 */
struct CommandReply {
    bool success = false;
    std::string message;
    std::string reaction;
};

/**
 * @brief Command surface for the voice features.
 * 
 * Every failure is caught here and turned into a reply; nothing thrown by
 * the core reaches the host.
 */
class VoiceCommands {
public:
    static constexpr const char* SPEAK_REACTION = "\xF0\x9F\x93\xA3"; // U+1F4E3 megaphone

    VoiceCommands(SessionRegistry& sessions,
                  ConnectionCoordinator& coordinator,
                  SpeechDispatcher& dispatcher,
                  const RequestValidator& validator);

    CommandReply connect(const CommandContext& ctx);
    CommandReply disconnect(const CommandContext& ctx);
    CommandReply say(const CommandContext& ctx, const std::string& message);

    /**
     * @brief Route by command name or alias (c, dc, s).
     */
    CommandReply dispatch(const std::string& command, const CommandContext& ctx, const std::string& args);

private:
    enum class Command { Connect, Disconnect, Say };

    CommandReply connect_error(const CommandContext& ctx, const std::string& detail);
    CommandReply disconnect_error(const std::string& detail);
    CommandReply say_error(const std::string& detail);

    SessionRegistry& sessions_;
    ConnectionCoordinator& coordinator_;
    SpeechDispatcher& dispatcher_;
    const RequestValidator& validator_;
    std::unordered_map<std::string, Command> command_map_;
};

} // namespace blabber

#endif // BLABBER_VOICE_COMMANDS_HPP
