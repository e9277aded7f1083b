#include <pipeline/latest_slot.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    using namespace std::chrono_literals;

    void test_publish_then_take() {
        vs::LatestSlot<std::string> slot;
        check(slot.publish(0, "a"), "first publish should be accepted");

        std::string v;
        check(slot.try_take(v) && v == "a", "take should return the published value");
        check(slot.last_taken_seq() == 0, "last_taken_seq should follow the taken value");
        check(!slot.try_take(v), "slot should be empty after a take");
    }

    void test_newer_publish_overwrites() {
        vs::LatestSlot<int> slot;
        check(slot.publish(1, 10), "publish 1 should be accepted");
        check(slot.publish(3, 30), "newer publish should replace the unclaimed value");
        check(slot.overwritten() == 1, "replacing an unclaimed value should count an overwrite");

        int v = 0;
        check(slot.try_take(v) && v == 30, "the newest value should be taken");
    }

    void test_stale_publish_is_rejected() {
        vs::LatestSlot<int> slot;
        (void)slot.publish(5, 50);
        check(!slot.publish(4, 40), "publish older than the held value should be rejected");
        check(!slot.publish(5, 55), "publish equal to the held value should be rejected");

        int v = 0;
        (void)slot.try_take(v);
        check(v == 50, "the held value should survive stale publishes");
        check(!slot.publish(2, 20), "publish older than the last taken value should be rejected");
        check(slot.stale() == 3, "three stale publishes should be counted");
        check(slot.publish(6, 60), "a newer publish after a take should be accepted");
    }

    void test_take_for_times_out() {
        vs::LatestSlot<int> slot;
        int v = 0;
        const auto t0 = std::chrono::steady_clock::now();
        check(!slot.take_for(v, 30ms), "take_for on an empty slot should time out");
        check(std::chrono::steady_clock::now() - t0 >= 25ms, "take_for should wait roughly its timeout");
    }

    void test_take_for_wakes_on_publish() {
        vs::LatestSlot<int> slot;
        std::thread producer([&] {
            std::this_thread::sleep_for(20ms);
            (void)slot.publish(0, 1);
        });
        int v = 0;
        check(slot.take_for(v, 2000ms) && v == 1, "take_for should wake on publish");
        producer.join();
    }

    void test_close_drains() {
        vs::LatestSlot<int> slot;
        (void)slot.publish(0, 1);
        slot.close();

        check(slot.closed(), "closed() should report true");
        check(!slot.publish(1, 2), "publish after close should be refused");
        check(!slot.drained(), "closed slot holding a value is not drained");

        int v = 0;
        check(slot.try_take(v) && v == 1, "held value should be takeable after close");
        check(slot.drained(), "closed empty slot should be drained");

        const auto t0 = std::chrono::steady_clock::now();
        check(!slot.take_for(v, 1000ms), "take on a drained slot should fail");
        check(std::chrono::steady_clock::now() - t0 < 500ms, "take on a drained slot should not wait");
    }

    void test_consumer_sees_increasing_sequence() {
        vs::LatestSlot<int64_t> slot;
        constexpr int kPublishers = 3;
        constexpr int64_t kPerPublisher = 500;

        std::vector<std::thread> pubs;
        std::atomic<int> done{0};
        for (int p = 0; p < kPublishers; ++p) {
            pubs.emplace_back([&, p] {
                // interleaved sequence numbers, each publisher in order
                for (int64_t i = 0; i < kPerPublisher; ++i) {
                    const int64_t seq = i * kPublishers + p;
                    (void)slot.publish(seq, seq);
                }
                if (++done == kPublishers) slot.close();
            });
        }

        int64_t last = -1;
        bool increasing = true;
        int64_t v = 0;
        while (!slot.drained()) {
            if (!slot.take_for(v, 5ms)) continue;
            if (v <= last) increasing = false;
            last = v;
        }
        for (auto& t : pubs) t.join();

        check(increasing, "taken sequence numbers should be strictly increasing");
        check(last == kPublishers * kPerPublisher - 1, "the highest sequence number should always be delivered");
    }
}

int main() {
    test_publish_then_take();
    test_newer_publish_overwrites();
    test_stale_publish_is_rejected();
    test_take_for_times_out();
    test_take_for_wakes_on_publish();
    test_close_drains();
    test_consumer_sees_increasing_sequence();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all latest slot tests passed\n";
    return 0;
}
