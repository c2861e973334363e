#include "SessionRegistry.hpp"
#include "Logger.hpp"
#include <iostream>
#include <vector>

namespace blabber {

std::shared_ptr<VoiceSession> SessionRegistry::session(GuildId guild) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = sessions_[guild];
    if (!slot) {
        slot = std::make_shared<VoiceSession>(guild);
    }
    return slot;
}

std::shared_ptr<VoiceSession> SessionRegistry::find(GuildId guild) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(guild);
    return it == sessions_.end() ? nullptr : it->second;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionRegistry::connected_count() const {
    std::vector<std::shared_ptr<VoiceSession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [guild, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    size_t count = 0;
    for (auto& session : snapshot) {
        auto lock = session->lock();
        if (session->connected()) ++count;
    }
    return count;
}

void SessionRegistry::shutdown() {
    std::vector<std::shared_ptr<VoiceSession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [guild, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    for (auto& session : snapshot) {
        auto lock = session->lock();
        if (!session->connected()) continue;
        try {
            session->client()->disconnect();
        } catch (const std::exception& e) {
            std::cerr << "[SessionRegistry] Disconnect failed for guild " << session->guild()
                      << ": " << e.what() << std::endl;
        }
        session->reset();
        log_messagef("Shutdown", "guild %llu", static_cast<unsigned long long>(session->guild()));
    }
}

} // namespace blabber
