//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameQueue.h
// Purpose: Closeable blocking queue backing transport inbound sources
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace jsonrpc {

//==========================================================================================================
// FrameQueue<T>
// Purpose: Multi-producer queue with a blocking, stop-aware Pop.
// Notes:
//   - After Close(), Push() is rejected and Pop() drains what is left, then returns std::nullopt.
//==========================================================================================================
template <typename T>
class FrameQueue {
public:
    // Returns false when the queue is closed.
    bool Push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) {
                return false;
            }
            items.push_back(std::move(item));
        }
        cv.notify_one();
        return true;
    }

    std::optional<T> Pop(std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, stop, [this]() { return closed || !items.empty(); });
        if (items.empty()) {
            return std::nullopt;
        }
        T item = std::move(items.front());
        items.pop_front();
        return item;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

private:
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<T> items;
    bool closed{false};
};

} // namespace jsonrpc
