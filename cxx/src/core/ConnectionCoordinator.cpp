/**
 * @file ConnectionCoordinator.cpp
 * @brief Connect / move / disconnect transitions of a voice session.
 */

#include "ConnectionCoordinator.hpp"
#include "Logger.hpp"
#include "VoiceError.hpp"

namespace blabber {

const char* to_string(ConnectResult result) {
    switch (result) {
        case ConnectResult::Connected:      return "Connected";
        case ConnectResult::Moved:          return "Moved";
        case ConnectResult::AlreadyPresent: return "AlreadyPresent";
    }
    return "Unknown";
}

ConnectionCoordinator::ConnectionCoordinator(backend::VoiceGateway& gateway, const PermissionPolicy& permissions)
    : gateway_(gateway)
    , permissions_(permissions)
{
}

ConnectResult ConnectionCoordinator::connect_or_move(const CommandContext& ctx, VoiceSession& session) {
    if (!ctx.author_voice) {
        throw VoiceError(ErrorKind::InvalidRequest, "You must be connected to a voice channel");
    }
    auto lock = session.lock();
    return connect_or_move_locked(ctx, *ctx.author_voice, session, lock);
}

ConnectResult ConnectionCoordinator::connect_or_move_locked(const CommandContext& ctx, const VoiceChannel& target,
                                                            VoiceSession& session,
                                                            const std::unique_lock<std::mutex>& held) {
    if (!held.owns_lock()) {
        throw std::logic_error("connect_or_move_locked requires the session lock");
    }

    // 1. Not connected: permissions on the target, then connect.
    if (!session.connected()) {
        permissions_.has_required_permissions(ctx, target);

        auto client = gateway_.connect(session.guild(), target);
        session.attach(std::move(client));

        log_messagef("Connect", "guild %llu -> %s",
                     static_cast<unsigned long long>(session.guild()), target.name.c_str());
        return ConnectResult::Connected;
    }

    // 2. Already there: nothing to do.
    if (*session.channel() == target) {
        return ConnectResult::AlreadyPresent;
    }

    // 3. Elsewhere: the invoker must be allowed to take the bot, and the
    //    bot must be allowed in.
    permissions_.can_disconnect(ctx, session);
    permissions_.has_required_permissions(ctx, target);

    // Stale speech must not follow the bot into the new channel.
    if (session.has_player()) {
        session.source()->clear();
    }

    session.client()->move_to(target);
    session.release_player();

    log_messagef("Move", "guild %llu -> %s",
                 static_cast<unsigned long long>(session.guild()), target.name.c_str());
    return ConnectResult::Moved;
}

void ConnectionCoordinator::disconnect(const CommandContext& ctx, VoiceSession& session) {
    auto lock = session.lock();
    if (!session.connected()) {
        throw VoiceError(ErrorKind::NotConnected, "Blabber is not connected to any voice channel");
    }

    permissions_.can_disconnect(ctx, session);

    // Backend stops its player before closing. If it throws, nothing changed.
    session.client()->disconnect();
    session.reset();

    log_messagef("Disconnect", "guild %llu", static_cast<unsigned long long>(session.guild()));
}

} // namespace blabber
