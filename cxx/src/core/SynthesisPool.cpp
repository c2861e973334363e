/**
 * @file SynthesisPool.cpp
 * @brief Implementation of the shared synthesis worker pool.
 */

#include "SynthesisPool.hpp"
#include "Logger.hpp"
#include "VoiceError.hpp"
#include <algorithm>

namespace blabber {

SynthesisPool::SynthesisPool(std::shared_ptr<SpeechSynthesizer> synthesizer, int num_workers)
    : synthesizer_(std::move(synthesizer))
{
    int count = std::max(1, num_workers);
    workers_.reserve(count);
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back(&SynthesisPool::worker_loop, this);
    }
    EventLogger::instance().log_event("SynthWorkers", static_cast<float>(count));
}

SynthesisPool::~SynthesisPool() {
    shutdown();
}

std::shared_future<SpeechClip> SynthesisPool::submit(const SpeechRequest& request) {
    auto synthesizer = synthesizer_;
    std::packaged_task<SpeechClip()> task([synthesizer, request]() {
        return synthesizer->synthesize(request);
    });
    std::shared_future<SpeechClip> result = task.get_future().share();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw VoiceError(ErrorKind::Backend, "Speech synthesis is shutting down");
        }
        jobs_.push_back(std::move(task));
    }
    cv_.notify_one();
    return result;
}

void SynthesisPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void SynthesisPool::worker_loop() {
    while (true) {
        std::packaged_task<SpeechClip()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return; // stopping and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        // packaged_task captures engine exceptions into the future.
        job();
        completed_.fetch_add(1);
    }
}

} // namespace blabber
