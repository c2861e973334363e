/**
 * @file LoopbackVoiceGateway.hpp
 * @brief In-process voice backend that plays sources into a local sink.
 */

#ifndef BLABBER_LOOPBACK_VOICE_GATEWAY_HPP
#define BLABBER_LOOPBACK_VOICE_GATEWAY_HPP

#include "VoiceBackend.hpp"
#include "SynthesisPool.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace blabber::backend {

class LoopbackVoiceGateway;

/**
 * @brief Loopback connection for one guild.
 * 
 * play() starts a thread that pulls one frame per interval from the source
 * and hands speech frames to the owning gateway.
 */
class LoopbackVoiceClient : public VoiceClient {
public:
    LoopbackVoiceClient(LoopbackVoiceGateway& gateway, GuildId guild,
                        const VoiceChannel& channel, std::chrono::milliseconds frame_interval);
    ~LoopbackVoiceClient() override;

    const VoiceChannel& channel() const override { return channel_; }
    void move_to(const VoiceChannel& channel) override;
    void disconnect() override;
    bool is_connected() const override { return connected_; }
    bool is_playing() const override { return running_; }
    void play(std::shared_ptr<AudioSource> source) override;
    void stop() override;

private:
    void thread_loop();

    LoopbackVoiceGateway& gateway_;
    GuildId guild_;
    VoiceChannel channel_;
    std::chrono::milliseconds frame_interval_;
    std::atomic<bool> connected_;
    std::atomic<bool> running_;
    std::shared_ptr<AudioSource> source_;
    std::thread processing_thread_;
};

/**
 * @brief Hands out loopback clients and records what each guild "heard".
 */
class LoopbackVoiceGateway : public VoiceGateway {
public:
    using FrameSink = std::function<void(GuildId guild, const AudioFrame& frame)>;

    explicit LoopbackVoiceGateway(std::chrono::milliseconds frame_interval = std::chrono::milliseconds(20));

    std::unique_ptr<VoiceClient> connect(GuildId guild, const VoiceChannel& channel) override;

    /**
     * @brief Optional callback for every speech frame (called on player threads).
     */
    void set_sink(FrameSink sink);

    /**
     * @brief Texts of the clips started for a guild, in playback order.
     */
    std::vector<std::string> transcript(GuildId guild) const;

    size_t frames_played() const { return frames_played_.load(); }
    int connects() const { return connects_.load(); }

    // Called by clients
    void deliver(GuildId guild, const AudioFrame& frame);

private:
    std::chrono::milliseconds frame_interval_;
    FrameSink sink_;
    mutable std::mutex mutex_;
    std::map<GuildId, std::vector<std::string>> transcripts_;
    std::atomic<size_t> frames_played_{0};
    std::atomic<int> connects_{0};
};

/**
 * @brief Stand-in engine that renders silence sized to the text.
 * 
 * Roughly 60 ms per character at rate 1.0, scaled by speaking rate.
 */
class SilentSynthesizer : public SpeechSynthesizer {
public:
    explicit SilentSynthesizer(std::chrono::milliseconds latency = std::chrono::milliseconds(0))
        : latency_(latency)
    {}

    SpeechClip synthesize(const SpeechRequest& request) override;

private:
    std::chrono::milliseconds latency_;
};

} // namespace blabber::backend

#endif // BLABBER_LOOPBACK_VOICE_GATEWAY_HPP
