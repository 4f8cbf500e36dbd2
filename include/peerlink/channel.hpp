/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_CHANNEL_HPP
#define PEERLINK_CHANNEL_HPP

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace peerlink {

/**
 * @brief Bounded multi-producer / multi-consumer queue used between tasks.
 *
 * - Block: push waits for free space (up to a timeout).
 * - DropOldest: push never waits; when full the oldest element is evicted and counted in dropped().
 *
 * close() wakes every waiter. After close push fails, pop drains what is left and then returns nullopt.
 */
    template <typename T>
    class BoundedChannel {
    public:
        enum class Overflow { Block, DropOldest };

        explicit BoundedChannel(size_t capacity, Overflow policy = Overflow::Block)
                : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

        BoundedChannel(const BoundedChannel&) = delete;
        BoundedChannel& operator=(const BoundedChannel&) = delete;

        bool push(T value, std::chrono::milliseconds timeout = std::chrono::milliseconds::max()) {
            std::unique_lock<std::mutex> lk(mtx_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                if (policy_ == Overflow::DropOldest) {
                    queue_.pop_front();
                    ++dropped_;
                } else {
                    auto hasSpace = [this] { return closed_ || queue_.size() < capacity_; };
                    if (timeout == std::chrono::milliseconds::max()) {
                        notFull_.wait(lk, hasSpace);
                    } else if (!notFull_.wait_for(lk, timeout, hasSpace)) {
                        return false;
                    }
                    if (closed_) return false;
                }
            }
            queue_.push_back(std::move(value));
            notEmpty_.notify_one();
            return true;
        }

        bool tryPush(T value) {
            return push(std::move(value), std::chrono::milliseconds(0));
        }

        std::optional<T> pop(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lk(mtx_);
            if (!notEmpty_.wait_for(lk, timeout, [this] { return closed_ || !queue_.empty(); })) {
                return std::nullopt;
            }
            return takeFront();
        }

        std::optional<T> tryPop() {
            std::lock_guard<std::mutex> lk(mtx_);
            return takeFront();
        }

        void close() {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                closed_ = true;
            }
            notEmpty_.notify_all();
            notFull_.notify_all();
        }

        bool closed() const {
            std::lock_guard<std::mutex> lk(mtx_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lk(mtx_);
            return queue_.size();
        }

        size_t capacity() const { return capacity_; }

        uint64_t dropped() const {
            std::lock_guard<std::mutex> lk(mtx_);
            return dropped_;
        }

    private:
        std::optional<T> takeFront() {
            if (queue_.empty()) return std::nullopt;
            T v = std::move(queue_.front());
            queue_.pop_front();
            notFull_.notify_one();
            return v;
        }

        const size_t capacity_;
        const Overflow policy_;
        mutable std::mutex mtx_;
        std::condition_variable notEmpty_;
        std::condition_variable notFull_;
        std::deque<T> queue_;
        bool closed_{false};
        uint64_t dropped_{0};
    };

} // namespace peerlink

#endif // PEERLINK_CHANNEL_HPP
