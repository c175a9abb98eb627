/**
 * @file ice_candidate_buffer.hpp
 * @brief ICE Candidate 缓冲
 *
 * 远端描述尚未设置前到达的 candidate 先按 FIFO 缓存，
 * flush 后按入队顺序一次性转发，之后的 candidate 直接转发。
 * 每个 lane 容量有限，溢出时丢弃最旧的 candidate。
 *
 * 非线程安全：由所属会话（持有会话锁）独占使用
 */

#pragma once

#include "session_core/types.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>

namespace telelink::core {

class IceCandidateBuffer {
public:
    using ForwardFn = std::function<void(const IceCandidate&)>;

    static constexpr size_t kDefaultCapacity = 64;

    explicit IceCandidateBuffer(size_t capacity = kDefaultCapacity);

    /**
     * @brief 入队 candidate
     * @param key lane 标识（服务端为接收方参与者 ID）
     * @param candidate 候选地址
     * @param forward 已 flush 的 lane 直接调用该函数转发
     * @return true 表示已直接转发，false 表示已缓存
     */
    bool enqueue(const std::string& key,
                 const IceCandidate& candidate,
                 const ForwardFn& forward);

    /**
     * @brief 远端描述已设置，按 FIFO 转发全部缓存并标记 lane 为已 flush
     * @return 转发的 candidate 数量
     */
    size_t flush(const std::string& key, const ForwardFn& forward);

    /**
     * @brief 释放 lane（会话结束时调用）
     */
    void release(const std::string& key);

    /**
     * @brief 释放全部 lane
     */
    void clear();

    bool is_flushed(const std::string& key) const;
    size_t pending(const std::string& key) const;
    size_t dropped(const std::string& key) const;

    size_t capacity() const { return capacity_; }

private:
    struct Lane {
        std::deque<IceCandidate> queue;
        bool flushed = false;
        size_t dropped = 0;
    };

    size_t capacity_;
    std::unordered_map<std::string, Lane> lanes_;
};

} // namespace telelink::core
