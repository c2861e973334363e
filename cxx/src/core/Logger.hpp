#pragma once

#include <atomic>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <optional>
#include <ostream>
#include <thread>

namespace blabber {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size so that logging never allocates.
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type;
    char tag[32];      // Category or Tag
    float value;       // Numeric value (for Type::Event)
    char message[64];  // Truncated message (for Type::Message)
    uint64_t timestamp; // Milliseconds since epoch
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);
        
        if (((h + 1) & mask) == t) {
            return false; // Full
        }
        
        buffer[h] = item;
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);
        
        if (t == h) {
            return std::nullopt; // Empty
        }
        
        T item = buffer[t];
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

private:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton telemetry logger for the voice core.
 *
 * Command threads, synthesis workers and player threads all produce entries,
 * so pushes are serialized by a producer mutex. Draining (pop_entry / flush)
 * must stay on one consumer thread.
 *
 * Once the ring is full new entries are dropped, so a long-running host
 * keeps an EventLogDrain alive (or drains by hand).
 */
class EventLogger {
public:
    static EventLogger& instance() {
        static EventLogger inst;
        return inst;
    }

    void log_message(const char* tag, const char* msg) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_ms();
        push(entry);
    }

    void log_event(const char* tag, float value) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_ms();
        push(entry);
    }

    // Consumer side
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain all pending entries to a stream.
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer.pop()) {
            out << "[" << entry->timestamp << "][" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                out << entry->message;
            } else {
                out << entry->value;
            }
            out << '\n';
            ++count;
        }
        out.flush();
        return count;
    }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    EventLogger() = default;

    void push(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        if (!ring_buffer.push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    static uint64_t now_ms() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
    std::mutex producer_mutex_;
    std::atomic<uint64_t> dropped_{0};
};

/**
 * @brief Background consumer flushing EventLogger to a stream at a fixed interval.
 *
 * Owns the consumer side while alive. stop() (or destruction) joins the
 * thread and writes whatever is still pending.
 */
class EventLogDrain {
public:
    explicit EventLogDrain(std::ostream& out,
                           std::chrono::milliseconds interval = std::chrono::milliseconds(100))
        : out_(out)
        , interval_(interval)
        , processing_thread_(&EventLogDrain::thread_loop, this)
    {}

    ~EventLogDrain() { stop(); }

    EventLogDrain(const EventLogDrain&) = delete;
    EventLogDrain& operator=(const EventLogDrain&) = delete;

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        cv_.notify_all();
        if (processing_thread_.joinable()) {
            processing_thread_.join();
        }
        EventLogger::instance().flush(out_);
    }

private:
    void thread_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_) {
            cv_.wait_for(lock, interval_, [this] { return !running_; });
            lock.unlock();
            EventLogger::instance().flush(out_);
            lock.lock();
        }
    }

    std::ostream& out_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = true;
    std::thread processing_thread_;  // last: started after the members above
};

/**
 * @brief printf-style convenience wrapper; output is truncated to one entry.
 */
template<typename... Args>
inline void log_messagef(const char* tag, const char* fmt, Args... args) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, args...);
    EventLogger::instance().log_message(tag, buf);
}

} // namespace blabber
