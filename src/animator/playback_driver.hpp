// Gridlight: worker thread that clocks playback and runs deferred device I/O
#pragma once
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace gridlight {
namespace animator {

// While armed, tick() runs once per period. A tick returning false
// disarms the driver. poke() wakes the thread to run service() as soon
// as possible, between ticks. Callbacks run on the worker thread without
// any driver lock held, so they may call back into the driver.
class PlaybackDriver {
public:
    typedef std::function<bool()> TickFunction;
    typedef std::function<void()> ServiceFunction;

    PlaybackDriver(TickFunction tick, ServiceFunction service = nullptr);
    ~PlaybackDriver();

    bool start();
    // Wakes and joins the worker; pending service work is dropped
    void stop();
    bool isRunning() const;

    // First tick happens one period from now
    void arm(int periodMs);
    void disarm();
    bool isArmed() const;
    // New period applies from the last tick (or the arm time)
    void reschedule(int periodMs);
    int getPeriodMs() const;

    void poke();

    uint64_t getTickCount() const;

private:
    typedef std::chrono::steady_clock Clock;

    TickFunction tickFn;
    ServiceFunction serviceFn;

    std::thread worker;
    mutable std::mutex mutex;
    std::condition_variable cv;

    bool running = false;
    bool shutdownRequested = false;
    bool armed = false;
    bool poked = false;
    // Bumped by arm/disarm so a tick in flight cannot re-arm a stale schedule
    uint64_t armGeneration = 0;
    int periodMs = 200;
    Clock::time_point lastTick;
    Clock::time_point nextTick;
    uint64_t tickCount = 0;

    void run();
};

}} // namespace gridlight::animator
