#include "os/rtos.hpp"
#include <atomic>
#include <iostream>

static int g_fail = 0;

static void check(bool ok, const char* what) {
    std::cout << "  " << (ok ? "PASS" : "FAIL") << ": " << what << "\n";
    if (!ok) ++g_fail;
}

Rtos::BinarySemaphore sem;
std::atomic<bool> g_acquired_late{false};

void Consumer(void*) {
    std::cout << "[Consumer] Waiting for semaphore...\n";
    if (sem.try_take()) {
        std::cout << "[Consumer] Semaphore acquired immediately!\n";
    } else {
        std::cout << "[Consumer] Semaphore not available, waiting...\n";
        sem.take();  // Will block until Producer gives
        g_acquired_late.store(true);
        std::cout << "[Consumer] Semaphore acquired after waiting!\n";
    }
}

void Producer(void*) {
    Rtos::SleepMs(100);
    std::cout << "[Producer] Giving semaphore now.\n";
    sem.give();
}

int main() {
    std::cout << "=== rtos_semaphore_test ===\n";

    std::cout << "\n[Test 1] Blocking take waits for give\n";
    {
        Rtos::Task consumerTask;
        Rtos::Task producerTask;

        check(consumerTask.Create("Consumer", Consumer, nullptr), "consumer created");
        check(producerTask.Create("Producer", Producer, nullptr), "producer created");

        consumerTask.Join();
        producerTask.Join();
        check(g_acquired_late.load(), "consumer blocked then acquired");
        check(!consumerTask.Running(), "joined task is not running");
    }

    std::cout << "\n[Test 2] Binary semaphore timed take\n";
    {
        Rtos::BinarySemaphore s;
        const uint64_t t0 = Rtos::MonoUs();
        check(!s.take(30), "take(30) times out when not given");
        check((Rtos::MonoUs() - t0) / 1000ull >= 25, "waited about the timeout");

        s.give();
        s.give();  // binary: second give is absorbed
        check(s.take(30), "take(30) succeeds after give");
        check(!s.try_take(), "only one token");
    }

    std::cout << "\n[Test 3] Counting semaphore\n";
    {
        Rtos::CountingSemaphore cs(2, 0);
        check(!cs.try_take(), "starts empty");
        check(!cs.take(30), "timed take times out");

        cs.give();
        cs.give();
        cs.give();  // clamped at max
        check(cs.take(30) && cs.take(30), "two tokens");
        check(!cs.try_take(), "third give was refused");
    }

    std::cout << "\nrtos_semaphore_test: " << (g_fail ? "FAIL" : "PASS") << "\n";
    return g_fail ? 1 : 0;
}
