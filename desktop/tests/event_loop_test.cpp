#include "unified_event_loop.h"
#include "event_funnel.h"
#include "timer_table.h"
#include "event_manager.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

template <typename Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

bool test_funnel_starts_closed() {
    std::cout << "Testing funnel open/close..." << std::endl;
    UnifiedEventLoop loop;
    std::vector<int> seen;
    EventFunnel<int> funnel("ints", loop, [&](const int& v) { seen.push_back(v); });

    TEST_ASSERT(funnel.isClosed(), "funnels start closed");
    TEST_ASSERT(!funnel.push(1), "closed funnel rejects events");

    funnel.open();
    TEST_ASSERT(funnel.push(2), "open funnel accepts events");
    TEST_ASSERT(funnel.push(3), "open funnel accepts events");
    TEST_ASSERT(funnel.pending() == 2, "events buffered until the loop runs");

    loop.runPending();
    TEST_ASSERT(seen.size() == 2 && seen[0] == 2 && seen[1] == 3, "handled in arrival order");

    funnel.push(4);
    funnel.close();
    loop.runPending();
    TEST_ASSERT(seen.size() == 2, "close discards buffered events");
    TEST_ASSERT(funnel.pending() == 0, "nothing left after close");

    std::cout << "Funnel open/close Passed!" << std::endl;
    return true;
}

bool test_funnel_close_mid_batch() {
    std::cout << "Testing funnel closed by its own handler..." << std::endl;
    UnifiedEventLoop loop;
    std::vector<int> seen;
    EventFunnel<int>* self = nullptr;
    EventFunnel<int> funnel("ints", loop, [&](const int& v) {
        seen.push_back(v);
        if (v == 2) self->close();
    });
    self = &funnel;

    funnel.open();
    funnel.push(1);
    funnel.push(2);
    funnel.push(3);
    loop.runPending();
    TEST_ASSERT(seen.size() == 2, "events after close are not delivered");

    std::cout << "Funnel closed mid-batch Passed!" << std::endl;
    return true;
}

bool test_funnels_serialized_across_threads() {
    std::cout << "Testing multi-producer funnels on one executor..." << std::endl;
    EventManager manager;
    UnifiedEventLoop& loop = manager.getUnifiedEventLoop();

    std::atomic<int> active{0};
    std::atomic<bool> overlap{false};
    std::atomic<int> handled{0};
    std::mutex order_mutex;
    std::vector<int> order_a;

    auto guard = [&]() {
        if (active.fetch_add(1) != 0) overlap = true;
        std::this_thread::yield();
        active.fetch_sub(1);
        handled.fetch_add(1);
    };

    EventFunnel<int> a("a", loop, [&](const int& v) {
        guard();
        std::lock_guard<std::mutex> lock(order_mutex);
        order_a.push_back(v);
    });
    EventFunnel<std::string> b("b", loop, [&](const std::string&) { guard(); });
    a.open();
    b.open();
    manager.startEventProcessing();

    const int per_thread = 500;
    std::thread producer_a([&] { for (int i = 0; i < per_thread; ++i) a.push(i); });
    std::thread producer_b([&] { for (int i = 0; i < per_thread; ++i) b.push("x"); });
    std::thread producer_c([&] { for (int i = 0; i < per_thread; ++i) b.push("y"); });
    producer_a.join();
    producer_b.join();
    producer_c.join();

    const bool all_handled = wait_until([&] { return handled.load() == 3 * per_thread; });
    a.close();
    b.close();
    manager.stopEventProcessing();

    TEST_ASSERT(all_handled, "every event handled exactly once");
    TEST_ASSERT(!overlap.load(), "handlers never run concurrently");
    for (int i = 0; i < per_thread; ++i) {
        TEST_ASSERT(order_a[i] == i, "one producer's events keep their order");
    }

    std::cout << "Multi-producer funnels Passed!" << std::endl;
    return true;
}

bool test_timer_table_generations() {
    std::cout << "Testing timer table..." << std::endl;
    UnifiedEventLoop loop;
    TimerTable timers(loop);
    std::vector<std::string> fired;

    timers.arm(TimerKind::BACKUP_INVITE, "p1", std::chrono::milliseconds(0), [&] { fired.push_back("first"); });
    timers.arm(TimerKind::BACKUP_INVITE, "p1", std::chrono::milliseconds(0), [&] { fired.push_back("second"); });
    TEST_ASSERT(timers.armedCount(TimerKind::BACKUP_INVITE) == 1, "re-arming replaces the timer");

    loop.runPending();
    TEST_ASSERT(fired.size() == 1 && fired[0] == "second", "only the latest timer fires");
    TEST_ASSERT(!timers.isArmed(TimerKind::BACKUP_INVITE, "p1"), "fired timer is disarmed");

    timers.arm(TimerKind::BACKUP_INVITE, "p2", std::chrono::milliseconds(0), [&] { fired.push_back("p2"); });
    timers.arm(TimerKind::RESTART, "services", std::chrono::milliseconds(0), [&] { fired.push_back("restart"); });
    TEST_ASSERT(timers.cancel(TimerKind::BACKUP_INVITE, "p2"), "cancel reports a live timer");
    TEST_ASSERT(!timers.cancel(TimerKind::BACKUP_INVITE, "p2"), "second cancel is a no-op");
    loop.runPending();
    TEST_ASSERT(fired.size() == 2 && fired[1] == "restart", "cancelled timer never fires");

    timers.arm(TimerKind::BACKUP_INVITE, "p3", std::chrono::milliseconds(0), [&] { fired.push_back("p3"); });
    timers.arm(TimerKind::BACKUP_INVITE, "p4", std::chrono::milliseconds(0), [&] { fired.push_back("p4"); });
    timers.arm(TimerKind::RESTART, "services", std::chrono::milliseconds(0), [&] { fired.push_back("restart2"); });
    TEST_ASSERT(timers.cancelKind(TimerKind::BACKUP_INVITE) == 2, "cancelKind counts cancelled timers");
    loop.runPending();
    TEST_ASSERT(fired.size() == 3 && fired[2] == "restart2", "other kinds survive cancelKind");

    // A cancel racing with the due pass still wins
    timers.arm(TimerKind::RESTART, "early", std::chrono::milliseconds(0), [&] {
        timers.cancel(TimerKind::BACKUP_INVITE, "p5");
    });
    timers.arm(TimerKind::BACKUP_INVITE, "p5", std::chrono::milliseconds(0), [&] { fired.push_back("p5"); });
    loop.runPending();
    TEST_ASSERT(fired.size() == 3, "timer cancelled after being picked up does not run");

    std::cout << "Timer table Passed!" << std::endl;
    return true;
}

bool test_scheduled_task_ordering() {
    std::cout << "Testing scheduled tasks on a running loop..." << std::endl;
    EventManager manager;
    UnifiedEventLoop& loop = manager.getUnifiedEventLoop();
    manager.startEventProcessing();

    std::mutex mutex;
    std::vector<int> order;
    const auto now = std::chrono::steady_clock::now();
    loop.addScheduledTask("late", [&] { std::lock_guard<std::mutex> l(mutex); order.push_back(2); },
                          now + std::chrono::milliseconds(80));
    loop.addScheduledTask("early", [&] { std::lock_guard<std::mutex> l(mutex); order.push_back(1); },
                          now + std::chrono::milliseconds(20));
    loop.addScheduledTask("gone", [&] { std::lock_guard<std::mutex> l(mutex); order.push_back(3); },
                          now + std::chrono::milliseconds(40));
    loop.removeScheduledTask("gone");
    TEST_ASSERT(!loop.hasScheduledTask("gone"), "removed task is gone");

    const bool done = wait_until([&] {
        std::lock_guard<std::mutex> l(mutex);
        return order.size() == 2;
    });
    manager.stopEventProcessing();
    TEST_ASSERT(done, "both tasks ran");
    TEST_ASSERT(order[0] == 1 && order[1] == 2, "tasks run in due order");
    TEST_ASSERT(!manager.isRunning(), "loop stopped");

    // The loop can be restarted after a stop
    std::atomic<bool> ran{false};
    manager.startEventProcessing();
    loop.post([&] { ran = true; });
    const bool restarted = wait_until([&] { return ran.load(); });
    manager.stopEventProcessing();
    TEST_ASSERT(restarted, "posted task runs after restart");

    std::cout << "Scheduled tasks Passed!" << std::endl;
    return true;
}

int main() {
    std::cout << "Running Event Loop Tests..." << std::endl;
    set_log_level(LogLevel::ERROR);

    test_funnel_starts_closed();
    test_funnel_close_mid_batch();
    test_funnels_serialized_across_threads();
    test_timer_table_generations();
    test_scheduled_task_ordering();

    if (tests_failed == 0) {
        std::cout << "ALL EVENT LOOP TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
