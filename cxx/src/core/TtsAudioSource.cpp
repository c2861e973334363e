/**
 * @file TtsAudioSource.cpp
 * @brief Implementation of the queued text-to-speech audio source.
 */

#include "TtsAudioSource.hpp"
#include "Logger.hpp"
#include "VoiceError.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace blabber {

TtsAudioSource::TtsAudioSource(SynthesisPool& pool, size_t capacity)
    : pool_(pool)
    , capacity_(capacity)
{
}

void TtsAudioSource::submit_request(SpeechRequest request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
        EventLogger::instance().log_event("QueueFull", static_cast<float>(queue_.size()));
        throw VoiceError(ErrorKind::QueueFull,
            "Too many messages are waiting to be spoken (limit " + std::to_string(capacity_) + ")");
    }

    // Pool submission happens under our lock so queue order == submit order.
    auto clip = pool_.submit(request);
    queue_.push_back({request.text(), std::move(clip)});
}

void TtsAudioSource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    // Abandoned futures still complete on the pool; their clips are discarded.
    queue_.clear();
    current_.reset();
    offset_ = 0;
}

bool TtsAudioSource::read(AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    frame.pcm.fill(0);
    frame.clip_start = false;
    frame.clip_text.clear();

    if (!current_) {
        if (queue_.empty()) {
            return false;
        }

        auto& head = queue_.front();
        if (head.clip.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }

        try {
            current_ = head.clip.get();
        } catch (const std::exception& e) {
            std::cerr << "[TtsAudioSource] Synthesis failed for \"" << head.text << "\": "
                      << e.what() << std::endl;
            EventLogger::instance().log_message("SynthFail", head.text.c_str());
            queue_.pop_front();
            return false;
        }
        queue_.pop_front();
        offset_ = 0;
        frame.clip_start = true;
        frame.clip_text = current_->text;
    }

    const auto& pcm = current_->pcm;
    if (offset_ < pcm.size()) {
        size_t count = std::min(AudioFrame::SAMPLES, pcm.size() - offset_);
        std::copy_n(pcm.begin() + static_cast<std::ptrdiff_t>(offset_), count, frame.pcm.begin());
    }
    offset_ += AudioFrame::SAMPLES;

    if (offset_ >= pcm.size()) {
        current_.reset();
        offset_ = 0;
    }
    return true;
}

size_t TtsAudioSource::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TtsAudioSource::streaming() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value();
}

} // namespace blabber
