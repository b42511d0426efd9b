/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SYNC_LOOP_HPP
#define SYNC_LOOP_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace MarkerSync {

/**
 * SyncLoop drives a marker server at a fixed interval.
 *
 * Every tick runs three callbacks in order:
 * - Poll: deliver transport traffic (feedback, snapshot requests, updates)
 * - Update: scene logic, staging changes on the server
 * - Flush: commit staged changes (usually InteractiveMarkerServer::applyChanges)
 *
 * The loop either blocks the caller (run) or owns a background thread (start).
 */
class SyncLoop {
public:
    // Callback function types
    using PollHandler = std::function<void()>;
    using UpdateHandler = std::function<void(float deltaTime)>;
    using FlushHandler = std::function<void()>;

    /**
     * Constructor
     * @param intervalMs Tick interval in milliseconds (0 is treated as 1)
     */
    explicit SyncLoop(uint32_t intervalMs = 100);

    /**
     * Destructor - stops the loop and joins the background thread
     */
    ~SyncLoop();

    void setPollHandler(PollHandler handler);
    void setUpdateHandler(UpdateHandler handler);
    void setFlushHandler(FlushHandler handler);

    /**
     * Run the loop on the calling thread
     * Blocks until stop() is called or a callback throws
     * @return true if the loop ended through stop(), false on error or if
     *         the loop was already running
     */
    bool run();

    /**
     * Run the loop on an owned background thread
     * @return false if the loop is already running
     */
    bool start();

    /**
     * Request the loop to stop after the current tick
     * Thread-safe, can be called from any thread including a callback
     */
    void stop();

    /**
     * Wait for a loop started with start() to finish
     * @return the result the loop would have returned from run()
     */
    bool wait();

    bool isRunning() const;

    /**
     * Run exactly one tick on the calling thread without pacing
     * @return false if a callback threw
     */
    bool tick(float deltaTime);

    uint64_t getTickCount() const;

    uint32_t getIntervalMs() const;
    void setIntervalMs(uint32_t intervalMs);

private:
    // Callback handlers
    PollHandler m_pollHandler;
    UpdateHandler m_updateHandler;
    FlushHandler m_flushHandler;
    std::mutex m_callbackMutex;

    // Loop state
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_lastRunResult{true};
    std::atomic<uint64_t> m_tickCount{0};
    std::atomic<uint32_t> m_intervalMs;

    // Background mode
    std::thread m_thread;
    std::mutex m_threadMutex;

    bool runLoop();

    // Thread-safe callback invocation, false if the callback threw
    bool invokePollHandler();
    bool invokeUpdateHandler(float deltaTime);
    bool invokeFlushHandler();

    // Prevent copying
    SyncLoop(const SyncLoop&) = delete;
    SyncLoop& operator=(const SyncLoop&) = delete;
};

} // namespace MarkerSync

#endif // SYNC_LOOP_HPP
