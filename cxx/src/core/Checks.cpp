/**
 * @file Checks.cpp
 * @brief Default permission and message policies.
 */

#include "Checks.hpp"
#include "VoiceError.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace blabber {

namespace {

// UTF-8 code points; continuation bytes are not counted.
size_t character_count(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
        [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

} // namespace

void GuildPermissionPolicy::can_disconnect(const CommandContext& ctx, const VoiceSession& session) const {
    const VoiceChannel* current = session.channel();
    if (!current) return;

    if (ctx.author_voice && *ctx.author_voice == *current) return;
    if (ctx.bot_channel_listeners == 0) return;
    if (has_permission(ctx.author_permissions, PERM_MOVE_MEMBERS)
        || has_permission(ctx.author_permissions, PERM_ADMINISTRATOR)) {
        return;
    }

    throw VoiceError(ErrorKind::Permission,
        "Blabber is being used in `" + current->name
        + "`; you need the Move Members permission to take it");
}

void GuildPermissionPolicy::has_required_permissions(const CommandContext& ctx, const VoiceChannel& channel) const {
    std::vector<std::string> missing;
    if (!has_permission(ctx.bot_permissions, PERM_CONNECT)) missing.push_back("Connect");
    if (!has_permission(ctx.bot_permissions, PERM_SPEAK)) missing.push_back("Speak");

    if (!missing.empty()) {
        std::string names;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) names += ", ";
            names += missing[i];
        }
        throw VoiceError(ErrorKind::Permission,
            "Blabber is missing permission(s) in `" + channel.name + "`: " + names);
    }

    bool full = channel.user_limit > 0 && channel.member_count >= channel.user_limit;
    if (full && !has_permission(ctx.bot_permissions, PERM_MOVE_MEMBERS)) {
        throw VoiceError(ErrorKind::Permission, "Voice channel `" + channel.name + "` is full");
    }
}

MessagePolicy::MessagePolicy(size_t max_length)
    : max_length_(max_length)
{
}

bool MessagePolicy::invoker_is_connected(const CommandContext& ctx) const {
    return ctx.author_voice.has_value();
}

void MessagePolicy::message_is_valid(const CommandContext& /* ctx */, const std::string& message) const {
    bool blank = std::all_of(message.begin(), message.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        throw VoiceError(ErrorKind::Validation, "Message is empty");
    }
    size_t length = character_count(message);
    if (length > max_length_) {
        throw VoiceError(ErrorKind::Validation,
            "Message is too long (" + std::to_string(length) + "/"
            + std::to_string(max_length_) + " characters)");
    }
}

} // namespace blabber
