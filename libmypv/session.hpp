#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "config.hpp"
#include "connection_state.hpp"
#include "imodbustransport.hpp"
#include "logging.hpp"
#include "modbus_types.hpp"
#include "register_field.hpp"

namespace mypv {

/**
 * Outstanding read or write request, or close in progress
 * */
class PendingRequest {
    public:
        typedef enum {
            READ,
            WRITE,
            CLOSE
        } Kind;

        PendingRequest(Kind kind, uint16_t address, const std::chrono::steady_clock::time_point& deadline)
            : mKind(kind), mAddress(address), mDeadline(deadline) {}

        Kind mKind;
        uint16_t mAddress;
        std::chrono::steady_clock::time_point mDeadline;
};

/**
 * Single logical connection to a device.
 *
 * At most one request is in flight. A request issued while another
 * one is pending fails with BusyError without blocking. Each transport
 * call is bounded by request deadline, a call that exceeds it is
 * abandoned and the next request waits for it to finish.
 *
 * Failures are classified into soft (timeout, protocol) and hard
 * (transport) ones and drive ConnectionState:
 *
 * Disconnected -> Connecting -> Connected on connect()
 * Connected -> Degraded after degrade_after consecutive soft failures
 * Degraded -> Connected on first success
 * Degraded -> Disconnected on any failure
 * any -> Disconnected on transport error
 * */
class Session {
    public:
        typedef std::function<void(ConnectionState oldState, ConnectionState newState)> StateListener;

        Session(const std::shared_ptr<IModbusTransport>& transport, const SessionConfig& config = SessionConfig());
        ~Session();

        /**
         * Throws ConnectError if connection cannot be established
         * */
        void connect();

        /**
         * Reads spans one by one. Returns registers for every span
         * in the same order. Throws RequestError on first failed span.
         * */
        std::vector<std::vector<uint16_t>> read(const std::vector<ReadSpan>& spans);
        std::vector<uint16_t> read(uint16_t address, int count);

        void write(const RegisterField& field, const std::vector<uint16_t>& words);
        void write(uint16_t address, const std::vector<uint16_t>& words);

        /**
         * Closes transport. Waits for abandoned request to finish.
         * Throws BusyError if called while request is in flight.
         * */
        void close();

        ConnectionState getState() const;
        unsigned int getSoftFailureCount() const;
        bool hasPendingRequest() const;

        /**
         * Called from thread that caused state transition
         * */
        void setStateListener(const StateListener& listener) { mStateListener = listener; }

    private:
        static boost::log::sources::severity_logger<Log::severity> log;

        class PendingGuard;

        std::vector<uint16_t> execute(PendingRequest::Kind kind, uint16_t address, int expectedCount, const std::function<std::vector<uint16_t>()>& call);
        void beginRequest(PendingRequest::Kind kind, uint16_t address);
        void endRequest();

        // wait for abandoned transport call, returns false if it is still running at deadline
        bool waitForAbandoned(const std::chrono::steady_clock::time_point& deadline);

        void onSuccess();
        void onFailure(const RequestError& error);
        void setState(ConnectionState newState, std::unique_lock<std::mutex>& lock);
        void closeTransport();

        std::shared_ptr<IModbusTransport> mTransport;
        SessionConfig mConfig;
        StateListener mStateListener;

        mutable std::mutex mMutex;
        ConnectionState mState = ConnectionState::DISCONNECTED;
        unsigned int mSoftFailureCount = 0;
        std::unique_ptr<PendingRequest> mPending;

        // transport call that exceeded its deadline
        std::future<std::vector<uint16_t>> mAbandoned;
};

}
