#include "session.hpp"

#include "exceptions.hpp"

namespace mypv {

boost::log::sources::severity_logger<Log::severity> Session::log;

class Session::PendingGuard {
    public:
        PendingGuard(Session& session) : mSession(session) {}
        ~PendingGuard() { mSession.endRequest(); }
    private:
        Session& mSession;
};

Session::Session(const std::shared_ptr<IModbusTransport>& transport, const SessionConfig& config)
    : mTransport(transport), mConfig(config)
{
    if (mTransport == nullptr)
        throw MyPvProgramException("Session needs a transport");
}

Session::~Session() {
    if (mAbandoned.valid())
        mAbandoned.wait();
    mTransport->close();
}

ConnectionState
Session::getState() const {
    std::unique_lock<std::mutex> lock(mMutex);
    return mState;
}

unsigned int
Session::getSoftFailureCount() const {
    std::unique_lock<std::mutex> lock(mMutex);
    return mSoftFailureCount;
}

bool
Session::hasPendingRequest() const {
    std::unique_lock<std::mutex> lock(mMutex);
    return mPending != nullptr;
}

void
Session::setState(ConnectionState newState, std::unique_lock<std::mutex>& lock) {
    ConnectionState oldState = mState;
    if (oldState == newState)
        return;

    mState = newState;
    if (newState == ConnectionState::DISCONNECTED)
        mSoftFailureCount = 0;

    BOOST_LOG_SEV(log, Log::info) << "Connection state changed from " << oldState << " to " << newState;

    if (mStateListener) {
        lock.unlock();
        mStateListener(oldState, newState);
        lock.lock();
    }
}

void
Session::closeTransport() {
    // abandoned call still uses transport, it will be closed on next connect()
    if (mAbandoned.valid() && mAbandoned.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        return;
    mTransport->close();
}

bool
Session::waitForAbandoned(const std::chrono::steady_clock::time_point& deadline) {
    if (!mAbandoned.valid())
        return true;

    if (mAbandoned.wait_until(deadline) != std::future_status::ready)
        return false;

    try {
        mAbandoned.get();
        BOOST_LOG_SEV(log, Log::debug) << "Discarded late response of abandoned request";
    } catch (const std::exception& ex) {
        BOOST_LOG_SEV(log, Log::debug) << "Abandoned request failed: " << ex.what();
    }
    return true;
}

void
Session::connect() {
    {
        std::unique_lock<std::mutex> lock(mMutex);
        if (mPending != nullptr || mState == ConnectionState::CONNECTING)
            throw BusyError("Cannot connect, request in progress");
        setState(ConnectionState::CONNECTING, lock);
    }

    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + mConfig.mRequestDeadline;
    try {
        if (!waitForAbandoned(deadline))
            throw ConnectError("Previous request is still running");

        mTransport->close();
        mTransport->connect();
    } catch (const ConnectError& ex) {
        std::unique_lock<std::mutex> lock(mMutex);
        setState(ConnectionState::DISCONNECTED, lock);
        throw;
    } catch (const RequestError& ex) {
        std::unique_lock<std::mutex> lock(mMutex);
        setState(ConnectionState::DISCONNECTED, lock);
        throw ConnectError(ex.what());
    } catch (const std::exception&) {
        std::unique_lock<std::mutex> lock(mMutex);
        setState(ConnectionState::DISCONNECTED, lock);
        throw;
    }

    std::unique_lock<std::mutex> lock(mMutex);
    mSoftFailureCount = 0;
    setState(ConnectionState::CONNECTED, lock);
}

void
Session::close() {
    {
        std::unique_lock<std::mutex> lock(mMutex);
        if (mPending != nullptr || mState == ConnectionState::CONNECTING)
            throw BusyError("Cannot close connection, request in progress");
        mPending.reset(new PendingRequest(PendingRequest::CLOSE, 0, std::chrono::steady_clock::now()));
    }
    PendingGuard guard(*this);

    if (mAbandoned.valid()) {
        mAbandoned.wait();
        waitForAbandoned(std::chrono::steady_clock::now());
    }
    mTransport->close();

    std::unique_lock<std::mutex> lock(mMutex);
    setState(ConnectionState::DISCONNECTED, lock);
}

void
Session::beginRequest(PendingRequest::Kind kind, uint16_t address) {
    std::unique_lock<std::mutex> lock(mMutex);
    if (mPending != nullptr || mState == ConnectionState::CONNECTING) {
        throw BusyError(std::string("Cannot ") + (kind == PendingRequest::READ ? "read" : "write")
            + " register " + std::to_string(address) + ", another request is in progress");
    }
    if (mState == ConnectionState::DISCONNECTED)
        throw TransportError("Cannot access register " + std::to_string(address) + ", not connected");

    mPending.reset(new PendingRequest(kind, address, std::chrono::steady_clock::now() + mConfig.mRequestDeadline));
}

void
Session::endRequest() {
    std::unique_lock<std::mutex> lock(mMutex);
    mPending.reset();
}

void
Session::onSuccess() {
    std::unique_lock<std::mutex> lock(mMutex);
    mSoftFailureCount = 0;
    if (mState == ConnectionState::DEGRADED)
        setState(ConnectionState::CONNECTED, lock);
}

void
Session::onFailure(const RequestError& error) {
    std::unique_lock<std::mutex> lock(mMutex);
    if (!error.isSoft()) {
        BOOST_LOG_SEV(log, Log::error) << "Transport error: " << error.what();
        setState(ConnectionState::DISCONNECTED, lock);
        closeTransport();
        return;
    }

    mSoftFailureCount++;
    BOOST_LOG_SEV(log, Log::debug) << "Request failed (" << mSoftFailureCount << " in a row): " << error.what();

    if (mState == ConnectionState::DEGRADED) {
        setState(ConnectionState::DISCONNECTED, lock);
        closeTransport();
    } else if (mState == ConnectionState::CONNECTED && mSoftFailureCount >= mConfig.mDegradeAfter) {
        setState(ConnectionState::DEGRADED, lock);
    }
}

std::vector<uint16_t>
Session::execute(PendingRequest::Kind kind, uint16_t address, int expectedCount, const std::function<std::vector<uint16_t>()>& call) {
    beginRequest(kind, address);
    PendingGuard guard(*this);

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point deadline = start + mConfig.mRequestDeadline;

    if (!waitForAbandoned(deadline)) {
        TimeoutError err("Register " + std::to_string(address) + ": previous request did not finish before deadline");
        onFailure(err);
        throw err;
    }

    std::future<std::vector<uint16_t>> result(std::async(std::launch::async, call));
    if (result.wait_until(deadline) != std::future_status::ready) {
        mAbandoned = std::move(result);
        TimeoutError err("Register " + std::to_string(address) + ": no response in "
            + std::to_string(mConfig.mRequestDeadline.count()) + "ms");
        onFailure(err);
        throw err;
    }

    std::vector<uint16_t> ret;
    try {
        ret = result.get();
    } catch (const RequestError& ex) {
        onFailure(ex);
        throw;
    }

    if (expectedCount >= 0 && ret.size() != static_cast<size_t>(expectedCount)) {
        ProtocolError err(ProtocolError::MALFORMED_RESPONSE, "Register " + std::to_string(address)
            + ": expected " + std::to_string(expectedCount) + " registers, got " + std::to_string(ret.size()));
        onFailure(err);
        throw err;
    }

    onSuccess();
    BOOST_LOG_SEV(log, Log::trace) << (kind == PendingRequest::READ ? "Read " : "Write ") << address
        << " done in " << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count() << "ms";
    return ret;
}

std::vector<uint16_t>
Session::read(uint16_t address, int count) {
    if (count <= 0)
        throw MyPvProgramException("Invalid register count " + std::to_string(count));

    std::shared_ptr<IModbusTransport> transport(mTransport);
    return execute(PendingRequest::READ, address, count, [transport, address, count]() -> std::vector<uint16_t> {
        return transport->readRegisters(address, count);
    });
}

std::vector<std::vector<uint16_t>>
Session::read(const std::vector<ReadSpan>& spans) {
    std::vector<std::vector<uint16_t>> ret;
    for(const ReadSpan& span: spans)
        ret.push_back(read(span.mRegister, span.mCount));
    return ret;
}

void
Session::write(uint16_t address, const std::vector<uint16_t>& words) {
    if (words.empty())
        throw MyPvProgramException("Nothing to write at " + std::to_string(address));

    std::shared_ptr<IModbusTransport> transport(mTransport);
    execute(PendingRequest::WRITE, address, -1, [transport, address, words]() -> std::vector<uint16_t> {
        transport->writeRegisters(address, words);
        return std::vector<uint16_t>();
    });
}

void
Session::write(const RegisterField& field, const std::vector<uint16_t>& words) {
    if (words.size() != field.mWordCount) {
        throw EncodeError(EncodeError::Reason::TYPE_MISMATCH, std::string("Field ") + field.mName + " needs "
            + std::to_string(field.mWordCount) + " register(s), got " + std::to_string(words.size()));
    }
    write(field.mAddress, words);
}

}
