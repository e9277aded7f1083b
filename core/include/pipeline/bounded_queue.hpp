#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace vs {
    enum class OverflowPolicy {
        DropNewest, // reject the incoming item
        DropOldest  // evict the head to admit the incoming item
    };

    template <class T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity, OverflowPolicy policy = OverflowPolicy::DropNewest)
            : cap_(capacity), policy_(policy) {}

        // Applies the queue's overflow policy. Returns false if the incoming item was not admitted.
        bool push(T v) {
            return policy_ == OverflowPolicy::DropOldest
                ? push_drop_oldest(std::move(v))
                : push_drop_newest(std::move(v));
        }

        bool push_drop_newest(T v) {
            {
                std::lock_guard lk(m_);
                if (stopped_ || closed_) return false;
                if (cap_ == 0 || q_.size() >= cap_) {
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return true;
        }

        bool push_drop_oldest(T v) {
            {
                std::lock_guard lk(m_);
                if (stopped_ || closed_) return false;
                if (cap_ == 0) {
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                if (q_.size() >= cap_) {
                    q_.pop_front();
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                }
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return true;
        }

        // Blocks the producer up to d for a free slot, then drops the incoming item.
        bool push_for(T v, std::chrono::milliseconds d) {
            {
                std::unique_lock lk(m_);
                const bool room = not_full_cv_.wait_for(lk, d, [&] {
                    return stopped_ || closed_ || q_.size() < cap_;
                });
                if (stopped_ || closed_) return false;
                if (!room) {
                    dropped_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return true;
        }

        bool try_pop(T& out) {
            {
                std::lock_guard lk(m_);
                if (stopped_ || q_.empty()) return false;
                out = std::move(q_.front());
                q_.pop_front();
            }
            not_full_cv_.notify_one();
            return true;
        }

        bool pop_for(T& out, std::chrono::milliseconds d) {
            {
                std::unique_lock lk(m_);
                if (!cv_.wait_for(lk, d, [&]{ return stopped_ || closed_ || !q_.empty(); })) return false;
                if (stopped_ || q_.empty()) return false;
                out = std::move(q_.front());
                q_.pop_front();
            }
            not_full_cv_.notify_one();
            return true;
        }

        // No more pushes; consumers may still drain what is queued.
        void close() {
            {
                std::lock_guard lk(m_);
                closed_ = true;
            }
            cv_.notify_all();
            not_full_cv_.notify_all();
        }

        // No more pushes or pops; pending items are discarded.
        void stop() {
            {
                std::lock_guard lk(m_);
                stopped_ = true;
                q_.clear();
            }
            cv_.notify_all();
            not_full_cv_.notify_all();
        }

        // True once nothing more will ever come out of the queue.
        bool drained() const {
            std::lock_guard lk(m_);
            return stopped_ || (closed_ && q_.empty());
        }

        size_t size() const {
            std::lock_guard lk(m_);
            return q_.size();
        }

        size_t capacity() const { return cap_; }
        OverflowPolicy policy() const { return policy_; }
        uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    private:
        size_t cap_;
        OverflowPolicy policy_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::condition_variable not_full_cv_;
        std::deque<T> q_;
        bool closed_ = false;
        bool stopped_ = false;
        std::atomic<uint64_t> dropped_{0};
    };
}
