/**
 * @file ice_candidate_buffer.cpp
 * @brief ICE Candidate 缓冲实现
 */

#include "session_core/ice_candidate_buffer.hpp"
#include "session_core/logger.hpp"

#include <algorithm>

namespace telelink::core {

IceCandidateBuffer::IceCandidateBuffer(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{
}

bool IceCandidateBuffer::enqueue(const std::string& key,
                                 const IceCandidate& candidate,
                                 const ForwardFn& forward) {
    auto& lane = lanes_[key];
    if (lane.flushed) {
        forward(candidate);
        return true;
    }

    if (lane.queue.size() >= capacity_) {
        // candidate 冗余且仅作建议，丢弃最旧的
        lane.queue.pop_front();
        ++lane.dropped;
        LOG_DEBUG("[IceCandidateBuffer] lane " << key << " full, dropped oldest candidate");
    }
    lane.queue.push_back(candidate);
    return false;
}

size_t IceCandidateBuffer::flush(const std::string& key, const ForwardFn& forward) {
    auto& lane = lanes_[key];

    size_t count = 0;
    while (!lane.queue.empty()) {
        IceCandidate candidate = std::move(lane.queue.front());
        lane.queue.pop_front();
        forward(candidate);
        ++count;
    }
    lane.flushed = true;
    return count;
}

void IceCandidateBuffer::release(const std::string& key) {
    lanes_.erase(key);
}

void IceCandidateBuffer::clear() {
    lanes_.clear();
}

bool IceCandidateBuffer::is_flushed(const std::string& key) const {
    auto it = lanes_.find(key);
    return it != lanes_.end() && it->second.flushed;
}

size_t IceCandidateBuffer::pending(const std::string& key) const {
    auto it = lanes_.find(key);
    return it != lanes_.end() ? it->second.queue.size() : 0;
}

size_t IceCandidateBuffer::dropped(const std::string& key) const {
    auto it = lanes_.find(key);
    return it != lanes_.end() ? it->second.dropped : 0;
}

} // namespace telelink::core
