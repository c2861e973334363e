/**
 * @file SpeechDispatcher.hpp
 * @brief Routes a say request into the guild's audio stream.
 */

#ifndef BLABBER_SPEECH_DISPATCHER_HPP
#define BLABBER_SPEECH_DISPATCHER_HPP

#include "AudioSource.hpp"
#include "Checks.hpp"
#include "ConnectionCoordinator.hpp"
#include "VoiceProfileRegistry.hpp"
#include "VoiceSession.hpp"
#include <functional>
#include <memory>
#include <string>

namespace blabber {

/**
 * @brief Acknowledgement of an accepted say request.
 */
struct SpeechReceipt {
    ConnectResult connection = ConnectResult::AlreadyPresent;
    bool created_source = false;
    bool started_playback = false;
    size_t queue_depth = 0;   // pending requests after this one was queued
};

/**
 * @brief Ensures a connection, obtains the source, submits, starts playback.
 */
class SpeechDispatcher {
public:
    using SourceFactory = std::function<std::shared_ptr<AudioSource>()>;

    /**
     * @param source_factory Creates a fresh source bound to the shared synthesis pool.
     */
    SpeechDispatcher(ConnectionCoordinator& coordinator,
                     const RequestValidator& validator,
                     const VoiceProfileRegistry& voices,
                     SourceFactory source_factory);

    /**
     * @brief Speak `message` in the invoker's voice channel.
     * 
     * Runs entirely under the session lock, so overlapping says on one guild
     * share a single source and keep submission order.
     * @throws VoiceError of any kind; session state is consistent on throw.
     */
    SpeechReceipt speak(const CommandContext& ctx, const std::string& message, VoiceSession& session);

private:
    ConnectionCoordinator& coordinator_;
    const RequestValidator& validator_;
    const VoiceProfileRegistry& voices_;
    SourceFactory source_factory_;
};

} // namespace blabber

#endif // BLABBER_SPEECH_DISPATCHER_HPP
