/**
 * @file SpeechRequest.hpp
 * @brief One unit of text-to-speech work.
 */

#ifndef BLABBER_SPEECH_REQUEST_HPP
#define BLABBER_SPEECH_REQUEST_HPP

#include "VoiceProfile.hpp"
#include <algorithm>
#include <string>

namespace blabber {

/**
 * @brief Immutable text + voice pairing handed to an AudioSource.
 *
 * Rate and pitch are clamped to the ranges synthesis engines accept.
 */
class SpeechRequest {
public:
    static constexpr double MIN_RATE = 0.25;
    static constexpr double MAX_RATE = 4.0;
    static constexpr double MIN_PITCH = -20.0;
    static constexpr double MAX_PITCH = 20.0;

    SpeechRequest(std::string text, const VoiceProfile& voice)
        : text_(std::move(text))
        , voice_(voice)
    {
        voice_.speaking_rate = std::clamp(voice_.speaking_rate, MIN_RATE, MAX_RATE);
        voice_.pitch = std::clamp(voice_.pitch, MIN_PITCH, MAX_PITCH);
    }

    const std::string& text() const { return text_; }
    const VoiceProfile& voice() const { return voice_; }

private:
    std::string text_;
    VoiceProfile voice_;
};

} // namespace blabber

#endif // BLABBER_SPEECH_REQUEST_HPP
