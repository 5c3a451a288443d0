/**
 * @file message_queue.hpp
 * @brief Unbounded FIFO with blocking and timeout-bound receive
 *
 * DIDAgent - Decentralized Identity Messaging Agent
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace didagent {

/**
 * @brief Thread-safe unbounded queue
 *
 * pop() blocks until an item arrives or the queue is closed. wait_for()
 * returns std::nullopt once the timeout elapses without an item. After
 * close() pending items can still be drained. interrupt() wakes waiters
 * without taking items or rejecting pushes.
 */
template <typename T>
class MessageQueue {
public:
    MessageQueue() = default;

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /**
     * @brief Append an item
     * @return false if the queue is closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cond_.notify_one();
        return true;
    }

    /**
     * @brief Block until an item is available
     * @return Item, or std::nullopt once closed and drained or while
     *         interrupted
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !items_.empty() || closed_ || interrupted_; });
        if (interrupted_) {
            return std::nullopt;
        }
        return take_locked();
    }

    /**
     * @brief Wait at most timeout for an item
     * @return Item, or std::nullopt on timeout or when closed and drained
     */
    template <typename Rep, typename Period>
    std::optional<T> wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    /**
     * @brief Take an item without waiting
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    /**
     * @brief Reject further pushes and wake all waiters
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cond_.notify_all();
    }

    /**
     * @brief Make pop() return std::nullopt until resume(); items stay queued
     */
    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cond_.notify_all();
    }

    void resume() {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = false;
    }

    /**
     * @brief Accept pushes again after close()
     */
    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        return size() == 0;
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    bool closed_ = false;
    bool interrupted_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
};

} // namespace didagent
