/**
 * @file session_registry.cpp
 * @brief 会话注册表实现
 */

#include "session_server/session_registry.hpp"
#include "session_core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace telelink::server {

// ==================== Session ====================

Participant* Session::find_participant(const std::string& participant_id) {
    for (auto& p : participants) {
        if (p.id == participant_id) {
            return &p;
        }
    }
    return nullptr;
}

const Participant* Session::find_participant(const std::string& participant_id) const {
    for (const auto& p : participants) {
        if (p.id == participant_id) {
            return &p;
        }
    }
    return nullptr;
}

Participant* Session::other_participant(const std::string& participant_id) {
    for (auto& p : participants) {
        if (p.id != participant_id) {
            return &p;
        }
    }
    return nullptr;
}

std::vector<std::string> Session::participant_ids() const {
    std::vector<std::string> ids;
    ids.reserve(participants.size());
    for (const auto& p : participants) {
        ids.push_back(p.id);
    }
    return ids;
}

bool Session::all_attached() const {
    if (participants.empty()) {
        return false;
    }
    return std::all_of(participants.begin(), participants.end(),
                       [](const Participant& p) { return p.attached(); });
}

bool Session::any_attached() const {
    return std::any_of(participants.begin(), participants.end(),
                       [](const Participant& p) { return p.attached(); });
}

// ==================== SessionRegistry ====================

SessionRegistry::SessionRegistry(size_t ice_buffer_capacity)
    : ice_buffer_capacity_(ice_buffer_capacity)
{
}

std::optional<std::string> SessionRegistry::create(
    core::SessionKind kind,
    const std::vector<std::string>& participants,
    const std::map<std::string, std::string>& metadata) {

    // 去重，保持顺序
    std::vector<std::string> unique;
    for (const auto& id : participants) {
        if (id.empty()) {
            continue;
        }
        if (std::find(unique.begin(), unique.end(), id) == unique.end()) {
            unique.push_back(id);
        }
    }

    if (unique.empty() || unique.size() > kMaxParticipants) {
        return std::nullopt;
    }

    auto entry = std::make_shared<Entry>(ice_buffer_capacity_);
    auto& session = entry->session;
    session.kind = kind;
    session.metadata = metadata;
    session.created_at = std::chrono::system_clock::now();
    for (const auto& id : unique) {
        Participant p;
        p.id = id;
        session.participants.push_back(std::move(p));
    }

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    std::string id;
    do {
        id = generate_session_id();
    } while (entries_.count(id) > 0);
    session.id = id;
    entries_.emplace(id, std::move(entry));

    LOG_INFO("[Registry] Session created: " << id
             << " (kind=" << core::to_string(kind)
             << ", participants=" << unique.size() << ")");
    return id;
}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find_entry(
    const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionRegistry::with_session(const std::string& session_id,
                                   const std::function<void(Session&)>& fn) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    fn(entry->session);
    return true;
}

std::optional<core::SessionState> SessionRegistry::state_of(const std::string& session_id) const {
    auto entry = find_entry(session_id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->session.state;
}

std::optional<SessionSnapshot> SessionRegistry::snapshot(const std::string& session_id) const {
    auto entry = find_entry(session_id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    const auto& s = entry->session;

    SessionSnapshot snap;
    snap.id = s.id;
    snap.kind = s.kind;
    snap.state = s.state;
    snap.participants = s.participant_ids();
    snap.metadata = s.metadata;
    snap.initiator_id = s.initiator_id;
    snap.created_at = s.created_at;
    snap.ended_at = s.ended_at;
    return snap;
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionRegistry::evict_ended(SteadyClock::time_point now,
                                    std::chrono::milliseconds grace) {
    std::unique_lock<std::shared_mutex> lock(map_mutex_);

    size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> entry_lock(it->second->mutex);
            const auto& s = it->second->session;
            expired = s.state == core::SessionState::Ended &&
                      s.ended_mono && now - *s.ended_mono >= grace;
        }

        if (expired) {
            LOG_DEBUG("[Registry] Session evicted: " << it->first);
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

size_t SessionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return entries_.size();
}

std::string SessionRegistry::generate_session_id() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 255);

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        ss << std::setw(2) << dis(gen);
    }

    return ss.str();
}

} // namespace telelink::server
