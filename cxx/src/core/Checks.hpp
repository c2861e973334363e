/**
 * @file Checks.hpp
 * @brief Permission and precondition checks consumed by the voice core.
 */

#ifndef BLABBER_CHECKS_HPP
#define BLABBER_CHECKS_HPP

#include "Types.hpp"
#include "VoiceSession.hpp"
#include <string>

namespace blabber {

/**
 * @brief Channel permission checks. Failures throw VoiceError (Permission).
 */
class PermissionPolicy {
public:
    virtual ~PermissionPolicy() = default;

    /**
     * @brief May the invoker pull the bot out of its current channel?
     */
    virtual void can_disconnect(const CommandContext& ctx, const VoiceSession& session) const = 0;

    /**
     * @brief Does the bot hold what it needs to join `channel`?
     */
    virtual void has_required_permissions(const CommandContext& ctx, const VoiceChannel& channel) const = 0;
};

/**
 * @brief Invocation preconditions.
 */
class RequestValidator {
public:
    virtual ~RequestValidator() = default;

    virtual bool invoker_is_connected(const CommandContext& ctx) const = 0;

    /**
     * @throws VoiceError (Validation) if the message may not be spoken.
     */
    virtual void message_is_valid(const CommandContext& ctx, const std::string& message) const = 0;
};

/**
 * @brief Default guild rules.
 * 
 * Disconnect/move is allowed when the invoker shares the bot's channel,
 * nobody else is listening, or the invoker can move members. Joining needs
 * Connect + Speak and room in the channel (unless the bot can move members).
 */
class GuildPermissionPolicy : public PermissionPolicy {
public:
    void can_disconnect(const CommandContext& ctx, const VoiceSession& session) const override;
    void has_required_permissions(const CommandContext& ctx, const VoiceChannel& channel) const override;
};

/**
 * @brief Default message rules: non-blank and at most max_length characters.
 */
class MessagePolicy : public RequestValidator {
public:
    explicit MessagePolicy(size_t max_length);

    bool invoker_is_connected(const CommandContext& ctx) const override;
    void message_is_valid(const CommandContext& ctx, const std::string& message) const override;

    size_t max_length() const { return max_length_; }

private:
    size_t max_length_;
};

} // namespace blabber

#endif // BLABBER_CHECKS_HPP
