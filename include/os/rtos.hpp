#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

// Timeouts are in milliseconds. MAX_TIMEOUT blocks forever.
static constexpr uint32_t MAX_TIMEOUT = 0xFFFFFFFFu;

void SleepMs(int ms);

// Monotonic clock in microseconds.
uint64_t MonoUs();

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Returns false if the thread could not be created.
    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

    bool Running() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper.
// lock()/unlock() make it usable with std::lock_guard.

class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Binary Semaphore abstraction ==//
class BinarySemaphore {
public:
    BinarySemaphore();
    ~BinarySemaphore();

    BinarySemaphore(const BinarySemaphore&) = delete;
    BinarySemaphore& operator=(const BinarySemaphore&) = delete;

    void take();                        // Blocks until available
    bool take(uint32_t timeout_ms);     // false on timeout
    bool try_take();                    // Non-blocking
    void give();                        // Releases the semaphore

private:
    struct SemaphoreHandle;
    SemaphoreHandle* handle_;
};


//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount    Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();                      // block until count>0, then --count
    bool take(uint32_t timeout_ms);   // as take(), false on timeout
    bool try_take();                  // non-blocking: if count>0 then --count, else false
    void give();                      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-size statically allocated queue
//
// Circular buffer synchronized with the OSAL Mutex and CountingSemaphore
// primitives. Works on Linux (POSIX) and maps onto native RTOS queues
// (xQueueSend / xQueueOverwrite) if ported.
//
// Overwrite mode (constructor flag): a send into a full queue discards the
// OLDEST unconsumed item and stores the new one, so the consumer always sees
// the freshest data. With Capacity == 1 this is a single-slot
// "freshest-wins" mailbox. wasLastSendOverwritten() reports whether the most
// recent send displaced an item.
//
// T must be default-constructible and copy-assignable.
template <typename T, size_t Capacity>
class Queue {
    static_assert(Capacity > 0, "Queue capacity must be non-zero");
public:
    explicit Queue(bool overwrite = false)
    : head(0), tail(0), overwrite_(overwrite) {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    // Blocking send. In overwrite mode this never blocks.
    bool send(const T& item, uint32_t timeout_ms = MAX_TIMEOUT) {
        if (overwrite_) {
            sendOverwrite(item);
            return true;
        }
        if (timeout_ms == MAX_TIMEOUT) {
            spaceAvailable.take();  // Wait for space
        } else if (!spaceAvailable.take(timeout_ms)) {
            return false;
        }
        push(item);
        last_overwritten_ = false;
        return true;
    }

    bool try_send(const T& item) {
        if (overwrite_) {
            sendOverwrite(item);
            return true;
        }
        if (!spaceAvailable.try_take()) return false;
        push(item);
        last_overwritten_ = false;
        return true;
    }

    void receive(T& item) {
        dataAvailable.take();  // Wait for data
        pop(item);
    }

    bool receive(T& item, uint32_t timeout_ms) {
        if (timeout_ms == MAX_TIMEOUT) {
            receive(item);
            return true;
        }
        if (!dataAvailable.take(timeout_ms)) return false;
        pop(item);
        return true;
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        pop(item);
        return true;
    }

    // Only meaningful from the (single) producer thread.
    bool wasLastSendOverwritten() const { return last_overwritten_; }

private:
    void push(const T& item) {
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
    }

    void pop(T& item) {
        lock.lock();
        item = buffer[tail];
        buffer[tail] = T{};     // drop our reference to the payload
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give();  // Signal space is available
    }

    void sendOverwrite(const T& item) {
        bool displaced = false;
        while (!spaceAvailable.try_take()) {
            // Full: steal the oldest item. If the consumer got it first,
            // its give() on spaceAvailable lets the next try_take succeed.
            if (dataAvailable.try_take()) {
                lock.lock();
                buffer[tail] = T{};
                tail = (tail + 1) % Capacity;
                lock.unlock();
                displaced = true;
                break; // slot freed by us; no spaceAvailable token to take
            }
        }
        push(item);
        last_overwritten_ = displaced;
    }

    T buffer[Capacity];
    size_t head, tail;
    const bool overwrite_;
    bool last_overwritten_ = false;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};
} // namespace Rtos
