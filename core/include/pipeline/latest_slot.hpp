#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace vs {
    // Single-slot mailbox keyed by sequence number. A publish overwrites an unclaimed value;
    // anything not newer than the held or the last taken value is rejected.
    template <class T>
    class LatestSlot {
    public:
        LatestSlot() = default;

        bool publish(int64_t seq, T v) {
            {
                std::lock_guard lk(m_);
                if (closed_) return false;
                if (seq <= last_taken_seq_ || (has_value_ && seq <= held_seq_)) {
                    stale_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
                if (has_value_) overwritten_.fetch_add(1, std::memory_order_relaxed);
                value_ = std::move(v);
                held_seq_ = seq;
                has_value_ = true;
            }
            cv_.notify_all();
            return true;
        }

        bool take_for(T& out, std::chrono::milliseconds d) {
            std::unique_lock lk(m_);
            if (!cv_.wait_for(lk, d, [&] { return closed_ || has_value_; })) return false;
            if (!has_value_) return false;
            out = std::move(value_);
            value_ = T{};
            has_value_ = false;
            last_taken_seq_ = held_seq_;
            return true;
        }

        bool try_take(T& out) {
            return take_for(out, std::chrono::milliseconds(0));
        }

        // Publishers are refused from now on; a held value can still be taken.
        void close() {
            {
                std::lock_guard lk(m_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool drained() const {
            std::lock_guard lk(m_);
            return closed_ && !has_value_;
        }

        bool closed() const {
            std::lock_guard lk(m_);
            return closed_;
        }

        int64_t last_taken_seq() const {
            std::lock_guard lk(m_);
            return last_taken_seq_;
        }

        uint64_t overwritten() const { return overwritten_.load(std::memory_order_relaxed); }
        uint64_t stale() const { return stale_.load(std::memory_order_relaxed); }

    private:
        mutable std::mutex m_;
        std::condition_variable cv_;
        T value_{};
        int64_t held_seq_ = -1;
        int64_t last_taken_seq_ = -1;
        bool has_value_ = false;
        bool closed_ = false;
        std::atomic<uint64_t> overwritten_{0};
        std::atomic<uint64_t> stale_{0};
    };
}
