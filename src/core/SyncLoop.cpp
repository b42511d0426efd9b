/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SyncLoop.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <chrono>
#include <exception>
#include <format>

namespace MarkerSync {

SyncLoop::SyncLoop(uint32_t intervalMs)
    : m_intervalMs(intervalMs == 0 ? 1 : intervalMs)
{
}

SyncLoop::~SyncLoop() {
    stop();
    wait();
}

void SyncLoop::setPollHandler(PollHandler handler) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_pollHandler = std::move(handler);
}

void SyncLoop::setUpdateHandler(UpdateHandler handler) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_updateHandler = std::move(handler);
}

void SyncLoop::setFlushHandler(FlushHandler handler) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_flushHandler = std::move(handler);
}

bool SyncLoop::run() {
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        SYNCLOOP_WARN("SyncLoop already running");
        return false;
    }
    m_stopRequested.store(false, std::memory_order_relaxed);

    bool result = runLoop();
    m_lastRunResult.store(result, std::memory_order_relaxed);
    m_running.store(false, std::memory_order_release);
    return result;
}

bool SyncLoop::start() {
    std::lock_guard<std::mutex> threadLock(m_threadMutex);

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        SYNCLOOP_WARN("SyncLoop already running");
        return false;
    }

    // Reap a previous background run that already finished
    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_stopRequested.store(false, std::memory_order_relaxed);
    m_thread = std::thread([this]() {
        bool result = runLoop();
        m_lastRunResult.store(result, std::memory_order_relaxed);
        m_running.store(false, std::memory_order_release);
    });

    SYNCLOOP_INFO(std::format("SyncLoop started in background ({}ms interval)",
                              m_intervalMs.load(std::memory_order_relaxed)));
    return true;
}

void SyncLoop::stop() {
    m_stopRequested.store(true, std::memory_order_relaxed);
}

bool SyncLoop::wait() {
    std::lock_guard<std::mutex> threadLock(m_threadMutex);
    if (m_thread.joinable()) {
        if (m_thread.get_id() == std::this_thread::get_id()) {
            SYNCLOOP_ERROR("SyncLoop::wait() called from the loop thread");
            return false;
        }
        m_thread.join();
    }
    return m_lastRunResult.load(std::memory_order_relaxed);
}

bool SyncLoop::isRunning() const {
    return m_running.load(std::memory_order_acquire);
}

uint64_t SyncLoop::getTickCount() const {
    return m_tickCount.load(std::memory_order_relaxed);
}

uint32_t SyncLoop::getIntervalMs() const {
    return m_intervalMs.load(std::memory_order_relaxed);
}

void SyncLoop::setIntervalMs(uint32_t intervalMs) {
    m_intervalMs.store(intervalMs == 0 ? 1 : intervalMs, std::memory_order_relaxed);
}

bool SyncLoop::tick(float deltaTime) {
    bool ok = invokePollHandler() && invokeUpdateHandler(deltaTime) && invokeFlushHandler();
    m_tickCount.fetch_add(1, std::memory_order_relaxed);
    return ok;
}

bool SyncLoop::runLoop() {
    using Clock = std::chrono::steady_clock;

    auto lastTick = Clock::now();

    while (!m_stopRequested.load(std::memory_order_relaxed)) {
        auto tickStart = Clock::now();
        float deltaTime = std::chrono::duration<float>(tickStart - lastTick).count();
        lastTick = tickStart;

        if (!tick(deltaTime)) {
            SYNCLOOP_CRITICAL(std::format("SyncLoop stopped after tick {} due to a callback error",
                                          m_tickCount.load(std::memory_order_relaxed)));
            return false;
        }

        // Sleep out the rest of the interval
        auto targetEnd = tickStart + std::chrono::milliseconds(m_intervalMs.load(std::memory_order_relaxed));
        auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEnd - Clock::now());
        if (remainingNs.count() > 0 && !m_stopRequested.load(std::memory_order_relaxed)) {
            SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
        }
    }

    SYNCLOOP_INFO(std::format("SyncLoop stopped after {} ticks",
                              m_tickCount.load(std::memory_order_relaxed)));
    return true;
}

bool SyncLoop::invokePollHandler() {
    PollHandler handlerCopy;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        handlerCopy = m_pollHandler;
    }
    if (handlerCopy) {
        try {
            handlerCopy();
        } catch (const std::exception& e) {
            SYNCLOOP_ERROR("Exception in poll handler: " + std::string(e.what()));
            return false;
        }
    }
    return true;
}

bool SyncLoop::invokeUpdateHandler(float deltaTime) {
    UpdateHandler handlerCopy;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        handlerCopy = m_updateHandler;
    }
    if (handlerCopy) {
        try {
            handlerCopy(deltaTime);
        } catch (const std::exception& e) {
            SYNCLOOP_ERROR("Exception in update handler: " + std::string(e.what()));
            return false;
        }
    }
    return true;
}

bool SyncLoop::invokeFlushHandler() {
    FlushHandler handlerCopy;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        handlerCopy = m_flushHandler;
    }
    if (handlerCopy) {
        try {
            handlerCopy();
        } catch (const std::exception& e) {
            SYNCLOOP_ERROR("Exception in flush handler: " + std::string(e.what()));
            return false;
        }
    }
    return true;
}

} // namespace MarkerSync
