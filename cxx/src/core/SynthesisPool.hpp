/**
 * @file SynthesisPool.hpp
 * @brief Worker pool shared by every audio source for speech synthesis.
 */

#ifndef BLABBER_SYNTHESIS_POOL_HPP
#define BLABBER_SYNTHESIS_POOL_HPP

#include "SpeechRequest.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace blabber {

/**
 * @brief Synthesized PCM for one request (48 kHz interleaved stereo).
 */
struct SpeechClip {
    std::string text;
    std::vector<int16_t> pcm;
};

/**
 * @brief Text-to-speech engine interface.
 * 
 * Implementations are called concurrently from the pool's workers.
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual SpeechClip synthesize(const SpeechRequest& request) = 0;
};

/**
 * @brief Fixed set of worker threads running synthesis jobs.
 * 
 * Guild-independent: sources from every guild post into the same pool.
 */
class SynthesisPool {
public:
    /**
     * @param synthesizer Engine shared by all workers.
     * @param num_workers Worker thread count (at least one is started).
     */
    SynthesisPool(std::shared_ptr<SpeechSynthesizer> synthesizer, int num_workers = 2);
    ~SynthesisPool();

    SynthesisPool(const SynthesisPool&) = delete;
    SynthesisPool& operator=(const SynthesisPool&) = delete;

    /**
     * @brief Queue a request for synthesis.
     * 
     * Engine exceptions are delivered through the future.
     */
    std::shared_future<SpeechClip> submit(const SpeechRequest& request);

    /**
     * @brief Stop accepting work, finish queued jobs and join workers.
     */
    void shutdown();

    size_t worker_count() const { return workers_.size(); }
    uint64_t completed() const { return completed_.load(); }

private:
    void worker_loop();

    std::shared_ptr<SpeechSynthesizer> synthesizer_;
    std::vector<std::thread> workers_;
    std::deque<std::packaged_task<SpeechClip()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<uint64_t> completed_{0};
};

} // namespace blabber

#endif // BLABBER_SYNTHESIS_POOL_HPP
