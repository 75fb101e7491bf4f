#include "poller.hpp"

#include <algorithm>

#include "exceptions.hpp"
#include "poller_messages.hpp"
#include "register_codec.hpp"

namespace mypv {

boost::log::sources::severity_logger<Log::severity> Poller::log;

class Poller::RunGuard {
    public:
        RunGuard(Poller& poller) : mPoller(poller) {}
        ~RunGuard() { mPoller.finishRun(); }
    private:
        Poller& mPoller;
};

Poller::Poller(
    const std::shared_ptr<Session>& session,
    const std::shared_ptr<const RegisterMap>& registerMap,
    const PollerConfig& config
) : mSession(session), mRegisterMap(registerMap), mConfig(config), mShouldStop(false)
{
    if (mSession == nullptr || mRegisterMap == nullptr)
        throw MyPvProgramException("Poller needs a session and register map");

    mSpans = RegisterMap::coalesceReads(mRegisterMap->pollableFields(), mConfig.mMaxReadSpan);

    BOOST_LOG_SEV(log, Log::debug) << "Polling " << mRegisterMap->getName() << " with " << mSpans.size() << " request(s)";
    for(const ReadSpan& span: mSpans) {
        BOOST_LOG_SEV(log, Log::trace) << "span " << span.firstRegister() << "-" << span.lastRegister()
            << ", " << span.mFields.size() << " field(s)";
    }

    mSession->setStateListener([this](ConnectionState oldState, ConnectionState newState) {
        notifyStateChange(oldState, newState);
    });
}

Poller::~Poller() {
    mSession->setStateListener(Session::StateListener());
}

bool
Poller::isCancelled() const {
    return mShouldStop;
}

bool
Poller::isRunning() const {
    std::unique_lock<std::mutex> lock(mMutex);
    return mRunning;
}

DeviceSnapshotPtr
Poller::getLastSnapshot() const {
    std::unique_lock<std::mutex> lock(mSnapshotMutex);
    return mLastSnapshot;
}

void
Poller::notifyStateChange(ConnectionState oldState, ConnectionState newState) {
    StateChangeCallback callback;
    {
        std::unique_lock<std::mutex> lock(mMutex);
        callback = mStateCallback;
    }
    if (callback)
        callback(oldState, newState);
}

bool
Poller::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mMutex);
    return !mStopCondition.wait_for(lock, duration, [this]{ return mShouldStop.load(); });
}

std::chrono::milliseconds
Poller::getRetryBackoff(unsigned int attempt) const {
    int64_t limit = mConfig.mMaxReconnectDelay.count();
    int64_t backoff = std::min<int64_t>(mConfig.mRetryBackoff.count(), limit);
    for (unsigned int i = 1; i < attempt && backoff < limit; i++)
        backoff = std::min<int64_t>(backoff * 2, limit);
    return std::chrono::milliseconds(backoff);
}

DeviceSnapshotPtr
Poller::readSnapshot() {
    std::vector<std::vector<uint16_t>> spanValues = mSession->read(mSpans);

    std::map<FieldId, SnapshotValue> values;
    int first = 0;
    int last = -1;
    if (!mSpans.empty()) {
        first = mSpans.front().firstRegister();
        last = mSpans.back().lastRegister();
    }
    std::vector<uint16_t> raw(last - first + 1, 0);

    for(size_t i = 0; i < mSpans.size(); i++) {
        const ReadSpan& span(mSpans[i]);
        const std::vector<uint16_t>& regs(spanValues[i]);
        std::copy(regs.begin(), regs.end(), raw.begin() + (span.firstRegister() - first));

        for(const RegisterField* field: span.mFields) {
            DomainValue value(RegisterCodec::decode(*field, span.slice(*field, regs), mRegisterMap->getWordOrder()));
            values.emplace(field->mId, SnapshotValue(value, mRegisterMap->isAvailable(*field)));
        }
    }

    return DeviceSnapshotPtr(new DeviceSnapshot(
        std::move(values),
        std::move(raw),
        first,
        std::chrono::system_clock::now(),
        std::chrono::steady_clock::now()
    ));
}

DeviceSnapshotPtr
Poller::pollOnce() {
    {
        // a stop request only cancels poll cycles started by run()
        std::unique_lock<std::mutex> lock(mMutex);
        if (!mRunning)
            mShouldStop = false;
    }

    unsigned int attempt = 0;
    while(true) {
        if (isCancelled())
            throw PollError(PollError::Cause::CANCELLED, attempt, "Poll cancelled");
        attempt++;
        try {
            DeviceSnapshotPtr snapshot(readSnapshot());
            {
                std::unique_lock<std::mutex> lock(mSnapshotMutex);
                mLastSnapshot = snapshot;
            }
            BOOST_LOG_SEV(log, Log::debug) << "Snapshot ready, " << snapshot->getValues().size() << " field(s), attempt " << attempt;
            return snapshot;
        } catch (const DecodeError& ex) {
            throw PollError(PollError::Cause::DECODE_FAILURE, attempt, std::string("Cannot decode device response: ") + ex.what());
        } catch (const RequestError& ex) {
            if (!ex.isSoft())
                throw PollError(PollError::Cause::HARD_FAILURE, attempt, ex.what());

            if (attempt > mConfig.mReadRetries)
                throw PollError(PollError::Cause::SOFT_FAILURE, attempt,
                    std::string("Read failed after ") + std::to_string(attempt) + " attempt(s): " + ex.what());

            std::chrono::milliseconds backoff(getRetryBackoff(attempt));
            BOOST_LOG_SEV(log, Log::debug) << "Read failed: " << ex.what() << ", retrying in " << backoff.count() << "ms";
            if (!waitFor(backoff))
                throw PollError(PollError::Cause::CANCELLED, attempt, "Poll cancelled");
        }
    }
}

bool
Poller::connectSession(std::chrono::milliseconds& reconnectDelay) {
    try {
        BOOST_LOG_SEV(log, Log::info) << "Connecting to " << mRegisterMap->getName();
        mSession->connect();
        reconnectDelay = std::chrono::milliseconds::zero();
        return true;
    } catch (const ConnectError& ex) {
        reconnectDelay = std::min(reconnectDelay + mConfig.mReconnectDelay, mConfig.mMaxReconnectDelay);
        BOOST_LOG_SEV(log, Log::error) << ex.what() << ", next attempt in " << reconnectDelay.count() << "ms";
        return false;
    }
}

void
Poller::run(std::chrono::milliseconds interval, const SnapshotCallback& onSnapshot, const StateChangeCallback& onStateChange) {
    if (interval <= std::chrono::milliseconds::zero())
        throw MyPvProgramException("Poll interval must be positive");
    {
        std::unique_lock<std::mutex> lock(mMutex);
        if (mRunning)
            throw MyPvProgramException("Poller is already running");
        mRunning = true;
        mPollerThreadId = std::this_thread::get_id();
        mStateCallback = onStateChange;
    }
    RunGuard guard(*this);

    BOOST_LOG_SEV(log, Log::debug) << "Poller started, interval " << interval.count() << "ms";
    std::chrono::milliseconds reconnectDelay(0);
    std::chrono::steady_clock::time_point nextPoll = std::chrono::steady_clock::now();
    mConsecutivePollErrors = 0;

    while(!isCancelled()) {
        if (mSession->getState() == ConnectionState::DISCONNECTED) {
            if (!connectSession(reconnectDelay)) {
                waitForMessages(std::chrono::steady_clock::now() + reconnectDelay);
                continue;
            }
            nextPoll = std::chrono::steady_clock::now();
        }

        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        if (nextPoll <= now) {
            nextPoll = now + interval;
            try {
                DeviceSnapshotPtr snapshot(pollOnce());
                mConsecutivePollErrors = 0;
                if (onSnapshot)
                    onSnapshot(snapshot);
            } catch (const PollError& ex) {
                if (ex.getCause() == PollError::Cause::CANCELLED)
                    break;
                mConsecutivePollErrors++;
                // do not flood log when device is unreachable for a long time
                if (mConsecutivePollErrors % 10 == 1) {
                    BOOST_LOG_SEV(log, Log::error) << "Poll failed (" << mConsecutivePollErrors << " in a row): " << ex.what();
                } else {
                    BOOST_LOG_SEV(log, Log::debug) << "Poll failed (" << mConsecutivePollErrors << " in a row): " << ex.what();
                }
            }
        }

        if (!isCancelled())
            waitForMessages(nextPoll);
    }
    BOOST_LOG_SEV(log, Log::debug) << "Poller ended";
}

void
Poller::waitForMessages(const std::chrono::steady_clock::time_point& until) {
    QueueItem item;
    while(!isCancelled()) {
        std::chrono::steady_clock::duration remaining = until - std::chrono::steady_clock::now();
        if (remaining < std::chrono::steady_clock::duration::zero())
            remaining = std::chrono::steady_clock::duration::zero();
        if (!mQueue.wait_dequeue_timed(item, remaining))
            return;
        dispatchMessage(item);
    }
}

void
Poller::dispatchMessage(QueueItem& item) {
    if (item.isSameAs(typeid(EndWorkMessage))) {
        BOOST_LOG_SEV(log, Log::debug) << "Got exit command";
    } else if (item.isSameAs(typeid(MsgRegisterWrite))) {
        executeWrite(*item.getData<MsgRegisterWrite>());
    } else {
        BOOST_LOG_SEV(log, Log::error) << "Unknown message received, ignoring";
    }
}

void
Poller::executeWrite(MsgRegisterWrite& msg) {
    try {
        mSession->write(msg.mAddress, msg.mValues);
        msg.mResult->set_value();
    } catch (const std::exception& ex) {
        BOOST_LOG_SEV(log, Log::error) << "Write to register " << msg.mAddress << " failed: " << ex.what();
        msg.mResult->set_exception(std::current_exception());
    }
}

void
Poller::finishRun() {
    {
        std::unique_lock<std::mutex> lock(mMutex);
        mRunning = false;
        mShouldStop = false;
        mStateCallback = StateChangeCallback();
    }
    // no producer can enqueue after mRunning is cleared
    QueueItem item;
    while(mQueue.try_dequeue(item)) {
        if (item.isSameAs(typeid(MsgRegisterWrite))) {
            std::unique_ptr<MsgRegisterWrite> msg(item.getData<MsgRegisterWrite>());
            msg->mResult->set_exception(std::make_exception_ptr(TransportError("Poller stopped before write was executed")));
        }
    }
}

void
Poller::stop() {
    std::unique_lock<std::mutex> lock(mMutex);
    mShouldStop = true;
    mStopCondition.notify_all();
    if (mRunning)
        mQueue.enqueue(QueueItem::create(EndWorkMessage()));
}

void
Poller::write(const RegisterField& field, const std::vector<uint16_t>& words) {
    if (words.size() != field.mWordCount) {
        throw EncodeError(EncodeError::Reason::TYPE_MISMATCH, std::string("Field ") + field.mName + " needs "
            + std::to_string(field.mWordCount) + " register(s), got " + std::to_string(words.size()));
    }
    write(field.mAddress, words);
}

void
Poller::write(uint16_t address, const std::vector<uint16_t>& words) {
    std::future<void> result;
    {
        std::unique_lock<std::mutex> lock(mMutex);
        if (mRunning && std::this_thread::get_id() != mPollerThreadId) {
            MsgRegisterWrite msg(address, words);
            result = msg.mResult->get_future();
            mQueue.enqueue(QueueItem::create(msg));
        }
    }
    if (result.valid()) {
        result.get();
        return;
    }
    mSession->write(address, words);
}

}
