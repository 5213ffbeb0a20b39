#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace fsmkit::core {

    // Unbounded multi-producer / single-consumer queue. Once sealed it refuses
    // new items but still hands out what it holds.
    template <typename T> class EventQueue {
      public:
        EventQueue() = default;
        EventQueue(const EventQueue &) = delete;
        EventQueue &operator=(const EventQueue &) = delete;

        bool push(T item) {
            {
                std::lock_guard<std::mutex> lk(m_);
                if (sealed_)
                    return false;
                q_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        // Blocks until an item is available. Empty once sealed and drained.
        std::optional<T> pop() {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [&] { return sealed_ || !q_.empty(); });
            return takeFront();
        }

        template <class Rep, class Period> std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait_for(lk, timeout, [&] { return sealed_ || !q_.empty(); });
            return takeFront();
        }

        // Appends `last` and refuses any further push. With discardPending the
        // queued items are dropped first; returns how many were dropped.
        std::size_t seal(T last, bool discardPending) {
            return seal(std::move(last), [discardPending](const T &) { return discardPending; });
        }

        // Same, dropping only the queued items for which `drop` returns true.
        // Kept items stay in order ahead of `last`.
        template <typename Drop> std::size_t seal(T last, Drop &&drop) {
            std::size_t dropped = 0;
            {
                std::lock_guard<std::mutex> lk(m_);
                if (sealed_)
                    return 0;
                for (auto it = q_.begin(); it != q_.end();) {
                    if (drop(static_cast<const T &>(*it))) {
                        it = q_.erase(it);
                        ++dropped;
                    } else {
                        ++it;
                    }
                }
                q_.push_back(std::move(last));
                sealed_ = true;
            }
            cv_.notify_all();
            return dropped;
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> lk(m_);
            return q_.size();
        }

        bool sealed() const {
            std::lock_guard<std::mutex> lk(m_);
            return sealed_;
        }

      private:
        std::optional<T> takeFront() {
            if (q_.empty())
                return std::nullopt;
            std::optional<T> item(std::move(q_.front()));
            q_.pop_front();
            return item;
        }

        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        bool sealed_ = false;
    };

} // namespace fsmkit::core
