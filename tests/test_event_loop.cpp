/**
 * Event Loop Tests
 *
 * Task ordering for the cooperative scheduler and the run()/stop() handshake.
 */

#include "engine/event_loop.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>
#include <vector>

using namespace tritpow::engine;

void test_fifo_order() {
    EventLoop loop;
    std::vector<int> order;

    loop.post([&] { order.push_back(1); loop.post([&] { order.push_back(3); }); });
    loop.post([&] { order.push_back(2); });
    assert(loop.pending() == 2);

    assert(loop.poll() == 3);
    assert((order == std::vector<int>{1, 2, 3}));
    assert(!loop.run_one());
    std::cout << "[PASS] Tasks run in posting order\n";
}

void test_run_until() {
    EventLoop loop;
    int count = 0;
    for (int i = 0; i < 5; i++) {
        loop.post([&] { count++; });
    }

    assert(loop.run_until([&] { return count == 2; }));
    assert(loop.pending() == 3);
    assert(!loop.run_until([&] { return count == 10; }));
    assert(count == 5);
    std::cout << "[PASS] run_until stops at the predicate or an empty queue\n";
}

void test_stop_from_task() {
    EventLoop loop;
    int count = 0;

    loop.post([&] { count++; });
    loop.post([&] { count++; loop.stop(); });
    loop.post([&] { count++; });

    loop.run();
    assert(count == 2);
    assert(loop.pending() == 1);
    std::cout << "[PASS] stop() from a task ends run()\n";
}

void test_stop_before_run() {
    EventLoop loop;

    std::thread stopper([&] { loop.stop(); });
    stopper.join();
    loop.run();     // returns at once

    // The stop was consumed: this run() waits for the task below
    std::atomic<bool> ran{false};
    std::thread poster([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        loop.post([&] {
            ran = true;
            loop.stop();
        });
    });
    loop.run();
    poster.join();
    assert(ran);
    std::cout << "[PASS] stop() before run() is not lost\n";
}

int main() {
    std::cout << "=== Event Loop Tests ===\n\n";

    try {
        test_fifo_order();
        test_run_until();
        test_stop_from_task();
        test_stop_before_run();

        std::cout << "\n=== All event loop tests passed! ===\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
