// Gridlight playback driver
#include <algorithm>
#include "playback_driver.hpp"

namespace gridlight {
namespace animator {

PlaybackDriver::PlaybackDriver(TickFunction tick, ServiceFunction service)
    : tickFn(tick), serviceFn(service) {}

PlaybackDriver::~PlaybackDriver() {
    stop();
}

bool PlaybackDriver::start() {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) return false;
    shutdownRequested = false;
    running = true;
    worker = std::thread(&PlaybackDriver::run, this);
    return true;
}

void PlaybackDriver::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) return;
        shutdownRequested = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();

    std::lock_guard<std::mutex> lock(mutex);
    running = false;
    armed = false;
    poked = false;
}

bool PlaybackDriver::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex);
    return running;
}

void PlaybackDriver::arm(int ms) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        periodMs = std::max(ms, 1);
        armed = true;
        ++armGeneration;
        lastTick = Clock::now();
        nextTick = lastTick + std::chrono::milliseconds(periodMs);
    }
    cv.notify_all();
}

void PlaybackDriver::disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        armed = false;
        ++armGeneration;
    }
    cv.notify_all();
}

bool PlaybackDriver::isArmed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return armed;
}

void PlaybackDriver::reschedule(int ms) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        periodMs = std::max(ms, 1);
        if (armed) nextTick = lastTick + std::chrono::milliseconds(periodMs);
    }
    cv.notify_all();
}

int PlaybackDriver::getPeriodMs() const {
    std::lock_guard<std::mutex> lock(mutex);
    return periodMs;
}

void PlaybackDriver::poke() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        poked = true;
    }
    cv.notify_all();
}

uint64_t PlaybackDriver::getTickCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tickCount;
}

void PlaybackDriver::run() {
    std::unique_lock<std::mutex> lock(mutex);
    while (!shutdownRequested) {
        if (poked) {
            poked = false;
            lock.unlock();
            if (serviceFn) serviceFn();
            lock.lock();
            continue;
        }

        if (!armed) {
            cv.wait(lock);
            continue;
        }

        Clock::time_point now = Clock::now();
        if (now < nextTick) {
            cv.wait_until(lock, nextTick);
            continue;
        }

        uint64_t generation = armGeneration;
        lastTick = now;
        lock.unlock();
        bool keep = tickFn ? tickFn() : false;
        lock.lock();
        ++tickCount;

        // Re-armed or disarmed while the tick ran
        if (generation != armGeneration) continue;
        if (!keep) {
            armed = false;
            continue;
        }
        nextTick = lastTick + std::chrono::milliseconds(periodMs);
    }
}

}} // namespace gridlight::animator
