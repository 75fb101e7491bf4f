#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <readerwriterqueue/readerwriterqueue.h>

#include "config.hpp"
#include "device_snapshot.hpp"
#include "logging.hpp"
#include "queue_item.hpp"
#include "register_map.hpp"
#include "session.hpp"

namespace mypv {

class MsgRegisterWrite;

/**
 * Reads all pollable fields of a device into snapshots.
 *
 * A snapshot is produced only if every span was read and decoded,
 * soft failures are retried with exponential backoff, hard failures
 * and decode errors end the cycle immediately.
 *
 * In continuous mode session is owned by the thread that called run(),
 * writes from other threads are queued and executed between cycles.
 * */
class Poller {
    public:
        typedef std::function<void(const DeviceSnapshotPtr& snapshot)> SnapshotCallback;
        typedef std::function<void(ConnectionState oldState, ConnectionState newState)> StateChangeCallback;

        Poller(
            const std::shared_ptr<Session>& session,
            const std::shared_ptr<const RegisterMap>& registerMap,
            const PollerConfig& config = PollerConfig()
        );
        ~Poller();

        /**
         * Single poll cycle. Throws PollError if snapshot
         * cannot be produced.
         * */
        DeviceSnapshotPtr pollOnce();

        /**
         * Polls every interval until stop() is called. Reconnects
         * session if it is disconnected.
         * */
        void run(std::chrono::milliseconds interval, const SnapshotCallback& onSnapshot, const StateChangeCallback& onStateChange);
        void run(const SnapshotCallback& onSnapshot, const StateChangeCallback& onStateChange) {
            run(mConfig.mInterval, onSnapshot, onStateChange);
        }

        /**
         * Request run() to end. Can be called from any thread
         * and from callbacks. No new cycle or retry starts after
         * this call.
         * */
        void stop();
        bool isRunning() const;

        /**
         * Single write attempt without retries. Throws the error
         * reported by session.
         * */
        void write(const RegisterField& field, const std::vector<uint16_t>& words);
        void write(uint16_t address, const std::vector<uint16_t>& words);

        // nullptr until first successful poll
        DeviceSnapshotPtr getLastSnapshot() const;

        // delay before retry after given failed attempt, doubled each time up to max_reconnect_delay
        std::chrono::milliseconds getRetryBackoff(unsigned int attempt) const;

        const std::vector<ReadSpan>& getReadSpans() const { return mSpans; }
        const std::shared_ptr<const RegisterMap>& getRegisterMap() const { return mRegisterMap; }

    private:
        static boost::log::sources::severity_logger<Log::severity> log;

        class RunGuard;

        DeviceSnapshotPtr readSnapshot();
        bool isCancelled() const;
        // false if cancelled before duration elapsed
        bool waitFor(std::chrono::milliseconds duration);
        void waitForMessages(const std::chrono::steady_clock::time_point& until);
        void dispatchMessage(QueueItem& item);
        void executeWrite(MsgRegisterWrite& msg);
        bool connectSession(std::chrono::milliseconds& reconnectDelay);
        void finishRun();
        void notifyStateChange(ConnectionState oldState, ConnectionState newState);

        std::shared_ptr<Session> mSession;
        std::shared_ptr<const RegisterMap> mRegisterMap;
        PollerConfig mConfig;
        std::vector<ReadSpan> mSpans;

        mutable std::mutex mSnapshotMutex;
        DeviceSnapshotPtr mLastSnapshot;

        // guards mRunning, queue producers and stop condition
        mutable std::mutex mMutex;
        std::condition_variable mStopCondition;
        bool mRunning = false;
        std::atomic<bool> mShouldStop;
        std::thread::id mPollerThreadId;
        StateChangeCallback mStateCallback;

        moodycamel::BlockingReaderWriterQueue<QueueItem> mQueue;

        int mConsecutivePollErrors = 0;
};

}
