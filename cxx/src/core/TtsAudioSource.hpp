/**
 * @file TtsAudioSource.hpp
 * @brief AudioSource that streams synthesized speech in submission order.
 */

#ifndef BLABBER_TTS_AUDIO_SOURCE_HPP
#define BLABBER_TTS_AUDIO_SOURCE_HPP

#include "AudioSource.hpp"
#include "SynthesisPool.hpp"
#include <deque>
#include <future>
#include <mutex>
#include <optional>

namespace blabber {

/**
 * @brief Bounded FIFO of speech requests backed by the synthesis pool.
 * 
 * Synthesis runs ahead on the pool; playback always follows the queue
 * order, waiting (emitting silence) while the head clip is not ready.
 */
class TtsAudioSource : public AudioSource {
public:
    /**
     * @param pool Shared synthesis pool; must outlive the source.
     * @param capacity Maximum number of pending requests.
     */
    TtsAudioSource(SynthesisPool& pool, size_t capacity);

    void submit_request(SpeechRequest request) override;
    void clear() override;
    bool read(AudioFrame& frame) override;
    size_t pending() const override;

    size_t capacity() const { return capacity_; }

    /**
     * @brief True while a clip is partially streamed.
     */
    bool streaming() const;

private:
    struct Entry {
        std::string text;
        std::shared_future<SpeechClip> clip;
    };

    SynthesisPool& pool_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::deque<Entry> queue_;
    std::optional<SpeechClip> current_;
    size_t offset_ = 0;
};

} // namespace blabber

#endif // BLABBER_TTS_AUDIO_SOURCE_HPP
