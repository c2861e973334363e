/**
 * @file BotSettings.hpp
 * @brief Thread-safe storage for runtime tunables of the voice core.
 */

#ifndef BLABBER_BOT_SETTINGS_HPP
#define BLABBER_BOT_SETTINGS_HPP

#include <atomic>
#include <cstddef>

namespace blabber {

/**
 * @brief Holds the process-wide bot settings.
 * 
 * Uses std::atomic so the config loader (writer) and the command threads
 * (readers) can share the instance without a lock.
 */
struct BotSettings {
    std::atomic<size_t> queue_capacity{32};       // pending requests per audio source
    std::atomic<size_t> max_message_length{600};  // characters accepted by say
    std::atomic<int> synthesis_workers{2};
    std::atomic<int> frame_interval_ms{20};       // loopback player pacing

    // Shared singleton instance for the process
    static BotSettings& instance() {
        static BotSettings inst;
        return inst;
    }
};

} // namespace blabber

#endif // BLABBER_BOT_SETTINGS_HPP
