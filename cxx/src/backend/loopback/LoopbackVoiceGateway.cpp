/**
 * @file LoopbackVoiceGateway.cpp
 * @brief In-process implementation of the VoiceGateway interface.
 */

#include "LoopbackVoiceGateway.hpp"
#include "Logger.hpp"
#include "VoiceError.hpp"
#include <algorithm>

namespace blabber::backend {

LoopbackVoiceClient::LoopbackVoiceClient(LoopbackVoiceGateway& gateway, GuildId guild,
                                         const VoiceChannel& channel,
                                         std::chrono::milliseconds frame_interval)
    : gateway_(gateway)
    , guild_(guild)
    , channel_(channel)
    , frame_interval_(frame_interval)
    , connected_(true)
    , running_(false)
{
}

LoopbackVoiceClient::~LoopbackVoiceClient() {
    stop();
}

void LoopbackVoiceClient::move_to(const VoiceChannel& channel) {
    if (!connected_) {
        throw VoiceError(ErrorKind::Connection, "Not connected to voice");
    }
    channel_ = channel;
    log_messagef("Loopback", "guild %llu moved to %llu",
                 static_cast<unsigned long long>(guild_),
                 static_cast<unsigned long long>(channel.id));
}

void LoopbackVoiceClient::disconnect() {
    stop();
    connected_ = false;
}

void LoopbackVoiceClient::play(std::shared_ptr<AudioSource> source) {
    if (!connected_) {
        throw VoiceError(ErrorKind::Backend, "Not connected to voice");
    }
    if (!source) {
        throw VoiceError(ErrorKind::Backend, "Cannot play a null audio source");
    }
    if (running_) {
        if (source == source_) return;
        throw VoiceError(ErrorKind::Backend, "Already playing audio");
    }
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }

    source_ = std::move(source);
    running_ = true;
    processing_thread_ = std::thread(&LoopbackVoiceClient::thread_loop, this);
}

void LoopbackVoiceClient::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    source_.reset();
}

void LoopbackVoiceClient::thread_loop() {
    AudioFrame frame;
    while (running_) {
        bool speech = source_->read(frame);
        if (speech) {
            gateway_.deliver(guild_, frame);
        }

        if (frame_interval_.count() > 0) {
            std::this_thread::sleep_for(frame_interval_);
        } else if (!speech) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

LoopbackVoiceGateway::LoopbackVoiceGateway(std::chrono::milliseconds frame_interval)
    : frame_interval_(frame_interval)
{
}

std::unique_ptr<VoiceClient> LoopbackVoiceGateway::connect(GuildId guild, const VoiceChannel& channel) {
    connects_.fetch_add(1);
    return std::make_unique<LoopbackVoiceClient>(*this, guild, channel, frame_interval_);
}

void LoopbackVoiceGateway::set_sink(FrameSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

std::vector<std::string> LoopbackVoiceGateway::transcript(GuildId guild) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transcripts_.find(guild);
    if (it == transcripts_.end()) return {};
    return it->second;
}

void LoopbackVoiceGateway::deliver(GuildId guild, const AudioFrame& frame) {
    frames_played_.fetch_add(1);

    FrameSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frame.clip_start) {
            transcripts_[guild].push_back(frame.clip_text);
        }
        sink = sink_;
    }
    if (sink) {
        sink(guild, frame);
    }
}

SpeechClip SilentSynthesizer::synthesize(const SpeechRequest& request) {
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }

    double ms = 60.0 * static_cast<double>(request.text().size()) / request.voice().speaking_rate;
    size_t frames = std::max<size_t>(1, static_cast<size_t>(ms) / AudioFrame::DURATION_MS);

    SpeechClip clip;
    clip.text = request.text();
    clip.pcm.assign(frames * AudioFrame::SAMPLES, 0);
    return clip;
}

} // namespace blabber::backend
