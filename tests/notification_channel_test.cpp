//
// Notification_channel / Deferred signal Test
//
// Validates the single-shot broadcast primitive behind every context channel:
// - observers registered before fire() get exactly one delivery
// - late subscribers get the stored value replayed on their own thread
// - only the first fire() has an effect
// - subscribe() racing fire() delivers exactly once per observer
// - unsubscribing prevents delivery
// - a throwing observer does not prevent delivery to the others
// - wait() / wait_for() block until the value arrives
// - an observer may release the last owner of the channel it is notified by
// - the deferred signal helpers
//

#include "test_utils.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr std::string_view k_failure_prefix = "notification_channel_test: ";

using tributary::test::require_true;

void test_fire_delivers_once()
{
    tributary::Notification_channel<int> channel;
    std::vector<int> seen;

    channel.subscribe([&seen](const int& v) { seen.push_back(v); });
    channel.subscribe([&seen](const int& v) { seen.push_back(v * 10); });

    require_true(!channel.fired(), k_failure_prefix, "channel must start unfired");
    require_true(channel.observer_count() == 2, k_failure_prefix, "two observers expected");

    require_true(channel.fire(7), k_failure_prefix, "first fire must report true");
    require_true(!channel.fire(8), k_failure_prefix, "second fire must report false");

    require_true(seen.size() == 2, k_failure_prefix, "each observer must be invoked once");
    require_true(seen[0] == 7 && seen[1] == 70, k_failure_prefix,
                 "observers must be invoked in registration order with the first value");
    require_true(channel.value() && *channel.value() == 7, k_failure_prefix,
                 "stored value must be the first fired one");
    require_true(channel.observer_count() == 0, k_failure_prefix,
                 "observers must be dropped after delivery");
}

void test_late_subscriber_replay()
{
    tributary::Notification_channel<std::string> channel;
    channel.fire("done");

    const auto subscriber_thread = std::this_thread::get_id();
    std::thread::id delivered_on;
    std::string delivered;
    channel.subscribe([&](const std::string& v) {
        delivered = v;
        delivered_on = std::this_thread::get_id();
    });

    require_true(delivered == "done", k_failure_prefix, "late subscriber must receive the value");
    require_true(delivered_on == subscriber_thread, k_failure_prefix,
                 "replay must happen on the subscribing thread");
}

void test_unsubscribe()
{
    tributary::Notification_channel<int> channel;
    int calls = 0;
    auto unsubscribe = channel.subscribe([&calls](const int&) { ++calls; });
    unsubscribe();
    channel.fire(1);
    require_true(calls == 0, k_failure_prefix, "unsubscribed observer must not be invoked");

    // after delivery, unsubscribing is harmless
    auto late = channel.subscribe([&calls](const int&) { ++calls; });
    late();
    require_true(calls == 1, k_failure_prefix, "replayed observer must be invoked once");
}

void test_unsubscribe_after_channel_destroyed()
{
    std::function<void()> unsubscribe;
    {
        tributary::Notification_channel<int> channel;
        unsubscribe = channel.subscribe([](const int&) {});
    }
    unsubscribe();
}

void test_throwing_observer_isolated()
{
    tributary::test::Log_capture capture(tributary::log_level::error);

    tributary::Notification_channel<int> channel;
    int calls = 0;
    channel.subscribe([](const int&) { throw std::runtime_error("observer failure"); });
    channel.subscribe([&calls](const int&) { ++calls; });
    channel.fire(3);

    require_true(calls == 1, k_failure_prefix,
                 "observer after a throwing one must still be invoked");
    require_true(capture.contains("observer failure", tributary::log_level::error),
                 k_failure_prefix, "observer failure must be logged as an error");
}

void test_observer_may_reenter()
{
    tributary::Notification_channel<int> first;
    tributary::Notification_channel<int> second;
    int second_seen = 0;

    first.subscribe([&](const int& v) {
        // subscribing to the channel that is firing, and firing another one
        first.subscribe([&](const int&) { second.fire(v + 1); });
    });
    second.subscribe([&second_seen](const int& v) { second_seen = v; });

    first.fire(41);
    require_true(second_seen == 42, k_failure_prefix,
                 "observers must be able to subscribe and fire without deadlock");
}

void test_subscribe_fire_race()
{
    constexpr int k_rounds = 200;
    constexpr int k_subscribers = 4;
    constexpr int k_subscriptions_per_thread = 25;

    tributary::detail::delay_fuzz_scope fuzz(0x5eed, 0, 20);

    for (int round = 0; round < k_rounds; ++round) {
        tributary::Notification_channel<int> channel;
        std::atomic<int> deliveries{0};
        std::atomic<bool> go{false};

        std::vector<std::thread> threads;
        for (int t = 0; t < k_subscribers; ++t) {
            threads.emplace_back([&] {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                for (int i = 0; i < k_subscriptions_per_thread; ++i) {
                    channel.subscribe([&deliveries](const int&) { deliveries.fetch_add(1); });
                }
            });
        }
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            channel.fire(round);
        });

        go.store(true);
        for (auto& th : threads) {
            th.join();
        }

        require_true(deliveries.load() == k_subscribers * k_subscriptions_per_thread,
                     k_failure_prefix,
                     "every observer must be delivered exactly once under a subscribe/fire race");
    }
}

void test_concurrent_fire_single_winner()
{
    constexpr int k_rounds = 200;
    constexpr int k_firers = 6;

    for (int round = 0; round < k_rounds; ++round) {
        tributary::Notification_channel<int> channel;
        std::atomic<int> winners{0};
        std::atomic<int> deliveries{0};
        channel.subscribe([&deliveries](const int&) { deliveries.fetch_add(1); });

        std::vector<std::thread> threads;
        for (int t = 0; t < k_firers; ++t) {
            threads.emplace_back([&, t] {
                if (channel.fire(t)) {
                    winners.fetch_add(1);
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }

        require_true(winners.load() == 1, k_failure_prefix, "exactly one fire() must win");
        require_true(deliveries.load() == 1, k_failure_prefix, "observer must be delivered once");
    }
}

void test_wait()
{
    tributary::Notification_channel<int> channel;
    std::thread firer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.fire(99);
    });
    const int value = channel.wait();
    firer.join();
    require_true(value == 99, k_failure_prefix, "wait() must return the fired value");

    require_true(channel.wait() == 99, k_failure_prefix, "wait() on a fired channel returns at once");
}

void test_wait_for_timeout()
{
    tributary::Notification_channel<int> channel;
    require_true(!channel.wait_for(std::chrono::milliseconds(10)), k_failure_prefix,
                 "wait_for() must time out on an unfired channel");
    require_true(channel.observer_count() == 0, k_failure_prefix,
                 "a timed out wait must not leave its observer behind");

    channel.fire(1);
    require_true(channel.wait_for(std::chrono::milliseconds(10)), k_failure_prefix,
                 "wait_for() must succeed on a fired channel");
}

void test_deferred_signal_helpers()
{
    auto resolved = tributary::make_resolved_signal();
    require_true(resolved->fired(), k_failure_prefix, "resolved signal must be fired");
    require_true(resolved->value()->succeeded(), k_failure_prefix, "resolved signal must succeed");
    require_true(!resolved->value()->already_completed, k_failure_prefix,
                 "resolved signal is not flagged already_completed by default");

    auto flagged = tributary::make_resolved_signal(true);
    require_true(flagged->value()->already_completed, k_failure_prefix,
                 "already_completed flag must be carried");

    auto failed = tributary::make_failed_signal(
        std::make_exception_ptr(std::logic_error("nope")));
    require_true(!failed->value()->succeeded(), k_failure_prefix, "failed signal must not succeed");

    bool rethrown = false;
    try {
        failed->value()->rethrow_if_failed();
    }
    catch (const std::logic_error&) {
        rethrown = true;
    }
    require_true(rethrown, k_failure_prefix, "rethrow_if_failed() must rethrow the failure");

    auto pending = tributary::make_deferred_signal();
    require_true(!pending->fired(), k_failure_prefix, "fresh deferred signal must be pending");
}

void test_observer_releases_signal()
{
    // a connector drops its link as soon as the acknowledgement arrives
    auto link = tributary::make_deferred_signal();
    bool later_delivered = false;
    link->subscribe([&link](const tributary::Signal_result&) { link.reset(); });
    link->subscribe([&later_delivered](const tributary::Signal_result& r) {
        later_delivered = r.succeeded();
    });

    require_true(link->fire(tributary::Signal_result{}), k_failure_prefix,
                 "first fire must report true");
    require_true(!link, k_failure_prefix, "the first observer must have released the signal");
    require_true(later_delivered, k_failure_prefix,
                 "observers after the releasing one must still get the value");

    // the same on replay, the late subscriber releases the last owner
    auto acknowledged = tributary::make_resolved_signal();
    bool replayed = false;
    acknowledged->subscribe([&acknowledged, &replayed](const tributary::Signal_result& r) {
        acknowledged.reset();
        replayed = r.succeeded();
    });
    require_true(replayed && !acknowledged, k_failure_prefix,
                 "replay must survive the subscriber releasing the signal");
}

} // namespace

int main()
{
    std::set_terminate(tributary::test::custom_terminate_handler);

    try {
        test_fire_delivers_once();
        test_late_subscriber_replay();
        test_unsubscribe();
        test_unsubscribe_after_channel_destroyed();
        test_throwing_observer_isolated();
        test_observer_may_reenter();
        test_subscribe_fire_race();
        test_concurrent_fire_single_winner();
        test_wait();
        test_wait_for_timeout();
        test_deferred_signal_helpers();
        test_observer_releases_signal();
    }
    catch (const std::exception& ex) {
        std::fprintf(stderr, "notification_channel_test failed: %s\n", ex.what());
        return 1;
    }

    std::fprintf(stderr, "notification_channel_test passed\n");
    return 0;
}
