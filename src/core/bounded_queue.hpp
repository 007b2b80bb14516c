#pragma once

#include "core/types.hpp"

#include <QDeadlineTimer>
#include <QMutex>
#include <QWaitCondition>

#include <cstddef>
#include <deque>
#include <optional>

namespace relayscout {

/**
 * BoundedQueue - fixed-capacity multi-producer queue that drops on overflow.
 *
 * Producers never block: try_push() fails when the queue is full or closed.
 * Discovery traffic is repeated periodically by devices, so a dropped
 * datagram or device update is recovered by the next announcement.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Enqueue without blocking.
     * @return false if the item was dropped (queue full or closed).
     */
    bool try_push(T item) {
        QMutexLocker lock(&mu_);
        if (closed_ || items_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        items_.push_back(std::move(item));
        cv_.wakeOne();
        return true;
    }

    [[nodiscard]] std::optional<T> try_pop() {
        QMutexLocker lock(&mu_);
        return take_front();
    }

    /**
     * Wait up to `timeout` for an item. Returns nullopt on timeout, or
     * immediately once the queue is closed and drained.
     */
    [[nodiscard]] std::optional<T> pop_for(Millis timeout) {
        QMutexLocker lock(&mu_);
        QDeadlineTimer deadline(timeout.count());
        while (!closed_ && items_.empty()) {
            if (!cv_.wait(&mu_, deadline)) break;
        }
        return take_front();
    }

    /**
     * Stop accepting items and wake all waiters. Items already queued can
     * still be popped.
     */
    void close() {
        QMutexLocker lock(&mu_);
        closed_ = true;
        cv_.wakeAll();
    }

    [[nodiscard]] bool is_closed() const {
        QMutexLocker lock(&mu_);
        return closed_;
    }

    [[nodiscard]] bool is_drained() const {
        QMutexLocker lock(&mu_);
        return closed_ && items_.empty();
    }

    [[nodiscard]] size_t size() const {
        QMutexLocker lock(&mu_);
        return items_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] size_t dropped() const {
        QMutexLocker lock(&mu_);
        return dropped_;
    }

private:
    std::optional<T> take_front() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    const size_t capacity_;
    mutable QMutex mu_;
    QWaitCondition cv_;
    std::deque<T> items_;
    bool closed_ = false;
    size_t dropped_ = 0;
};

} // namespace relayscout
