/**
 * @file AudioSource.hpp
 * @brief Abstract frame stream fed by a FIFO of speech requests.
 */

#ifndef BLABBER_AUDIO_SOURCE_HPP
#define BLABBER_AUDIO_SOURCE_HPP

#include "SpeechRequest.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace blabber {

/**
 * @brief 20 ms of 48 kHz interleaved stereo PCM.
 */
struct AudioFrame {
    static constexpr int SAMPLE_RATE = 48000;
    static constexpr int CHANNELS = 2;
    static constexpr int DURATION_MS = 20;
    static constexpr size_t SAMPLES = SAMPLE_RATE / 1000 * DURATION_MS * CHANNELS;

    std::array<int16_t, SAMPLES> pcm{};

    // Set on the first frame of each clip; carries the clip's text.
    bool clip_start = false;
    std::string clip_text;
};

/**
 * @brief Streaming audio object consumed by a voice backend player.
 * 
 * Producers (command threads) call submit_request/clear; the backend
 * player thread calls read. Implementations must make queue mutation
 * atomic with respect to concurrent submits, clears and reads.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * @brief Enqueue a request behind everything already submitted.
     * @throws VoiceError (QueueFull) when the backlog is at capacity.
     */
    virtual void submit_request(SpeechRequest request) = 0;

    /**
     * @brief Drop every pending request and the clip currently streaming.
     */
    virtual void clear() = 0;

    /**
     * @brief Fill the next 20 ms frame.
     * 
     * @return true if the frame carries speech, false if it is silence
     *         (nothing queued or the head clip is still synthesizing).
     */
    virtual bool read(AudioFrame& frame) = 0;

    /**
     * @brief Requests waiting behind the current clip.
     */
    virtual size_t pending() const = 0;
};

} // namespace blabber

#endif // BLABBER_AUDIO_SOURCE_HPP
