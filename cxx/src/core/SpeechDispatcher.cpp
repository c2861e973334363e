/**
 * @file SpeechDispatcher.cpp
 * @brief Implementation of the say pipeline.
 */

#include "SpeechDispatcher.hpp"
#include "Logger.hpp"
#include "SpeechRequest.hpp"
#include "VoiceError.hpp"

namespace blabber {

SpeechDispatcher::SpeechDispatcher(ConnectionCoordinator& coordinator,
                                   const RequestValidator& validator,
                                   const VoiceProfileRegistry& voices,
                                   SourceFactory source_factory)
    : coordinator_(coordinator)
    , validator_(validator)
    , voices_(voices)
    , source_factory_(std::move(source_factory))
{
}

SpeechReceipt SpeechDispatcher::speak(const CommandContext& ctx, const std::string& message, VoiceSession& session) {
    // 1. Preconditions
    if (!validator_.invoker_is_connected(ctx) || !ctx.author_voice) {
        throw VoiceError(ErrorKind::InvalidRequest, "You must be connected to a voice channel");
    }
    validator_.message_is_valid(ctx, message);

    SpeechReceipt receipt;
    auto lock = session.lock();

    // 2. Follow the invoker
    if (!session.connected() || *session.channel() != *ctx.author_voice) {
        receipt.connection = coordinator_.connect_or_move_locked(ctx, *ctx.author_voice, session, lock);
    }

    // 3. Reuse the live player's source, or make a new one
    std::shared_ptr<AudioSource> source = session.source();
    if (!source) {
        source = source_factory_();
        if (!source) {
            throw VoiceError(ErrorKind::Backend, "Audio source could not be created");
        }
        receipt.created_source = true;
    }

    // 4-5. Resolve the voice and queue the request
    VoiceProfile voice = voices_.resolve(ctx.author.id, ctx.text_channel);
    source->submit_request(SpeechRequest(message, voice));
    receipt.queue_depth = source->pending();

    // 6. Start playback if idle
    if (!session.is_playing()) {
        if (session.has_player()) {
            // Player recorded but its stream ended; restart it on the same source.
            session.client()->stop();
        }
        try {
            session.start_player(source);
        } catch (const VoiceError&) {
            if (receipt.created_source) {
                source->clear();
            } else {
                // The stopped player must not stay recorded without a running stream.
                session.release_player();
            }
            throw;
        }
        receipt.started_playback = true;
    }

    log_messagef("Say", "guild %llu depth %zu",
                 static_cast<unsigned long long>(session.guild()), receipt.queue_depth);
    return receipt;
}

} // namespace blabber
