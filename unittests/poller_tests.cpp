#include <limits>
#include <thread>

#include "catch2/catch_all.hpp"

#include "libmypv/exceptions.hpp"
#include "libmypv/poller.hpp"

#include "mockedtransport.hpp"

using namespace mypv;

namespace {

typedef std::vector<std::pair<ConnectionState, ConnectionState>> Transitions;

class PollerFixture {
    public:
        PollerFixture(const PollerConfig& config = testConfig(), unsigned int degradeAfter = 3)
            : mTransport(new MockedTransport())
        {
            mTransport->setupDevice("2002001912345678", 210, 2);
            SessionConfig sessionConfig;
            sessionConfig.mRequestDeadline = std::chrono::milliseconds(200);
            sessionConfig.mDegradeAfter = degradeAfter;
            mSession.reset(new Session(mTransport, sessionConfig));

            DeviceIdentity identity(DeviceModel::AC_THOR_9S, "2002001912345678", FirmwareVersion(210, 2));
            mPoller.reset(new Poller(mSession, RegisterMap::forDevice(identity), config));
        }

        static PollerConfig testConfig() {
            PollerConfig config;
            config.mInterval = std::chrono::milliseconds(20);
            config.mReadRetries = 2;
            config.mRetryBackoff = std::chrono::milliseconds(5);
            config.mReconnectDelay = std::chrono::milliseconds(10);
            config.mMaxReconnectDelay = std::chrono::milliseconds(30);
            return config;
        }

        std::shared_ptr<MockedTransport> mTransport;
        std::shared_ptr<Session> mSession;
        std::unique_ptr<Poller> mPoller;
};

PollError::Cause
pollErrorCause(Poller& poller) {
    try {
        poller.pollOnce();
    } catch (const PollError& ex) {
        return ex.getCause();
    }
    FAIL("Poll did not fail");
    return PollError::Cause::SOFT_FAILURE;
}

}

TEST_CASE ("Poll cycle should") {

SECTION ("read device in four requests") {
    PollerFixture f;
    REQUIRE(f.mPoller->getReadSpans().size() == 4);
    f.mSession->connect();
    f.mPoller->pollOnce();
    REQUIRE(f.mTransport->getReadCount() == 4);
}

SECTION ("decode all pollable fields") {
    PollerFixture f;
    f.mSession->connect();
    DeviceSnapshotPtr snapshot = f.mPoller->pollOnce();

    REQUIRE(snapshot->get(FieldId::POWER)->mValue == DomainValue::fromInt(1500));
    REQUIRE(snapshot->get(FieldId::TEMPERATURE_1)->mValue == DomainValue::fromRational(452, 10));
    REQUIRE(snapshot->get(FieldId::TEMPERATURE_2)->mValue == DomainValue::fromInt(-2));
    REQUIRE(snapshot->get(FieldId::FREQUENCY)->mValue.toString() == "50.012");
    REQUIRE(snapshot->get(FieldId::POWER_32)->mValue.getInt64() == 70000);
    REQUIRE(snapshot->get(FieldId::METER_POWER_32)->mValue.getInt64() == -300);
    REQUIRE(snapshot->get(FieldId::CONTROL_TYPE)->mValue.getTagName() == "MODBUS_TCP");
    REQUIRE(snapshot->getValues().size() == f.mPoller->getRegisterMap()->fields().size());
}

SECTION ("mark values without meaning for device as invalid") {
    PollerFixture f;
    f.mSession->connect();
    DeviceSnapshotPtr snapshot = f.mPoller->pollOnce();
    REQUIRE(snapshot->has(FieldId::TEMPERATURE_8));
    REQUIRE(!snapshot->isValid(FieldId::TEMPERATURE_8));
    REQUIRE(snapshot->isValid(FieldId::VOLTAGE_L3));
}

SECTION ("keep raw register contents") {
    PollerFixture f;
    f.mSession->connect();
    DeviceSnapshotPtr snapshot = f.mPoller->pollOnce();
    REQUIRE(snapshot->getFirstRegister() == 1000);
    REQUIRE(snapshot->getRawRegisters().size() == 89);
    REQUIRE(snapshot->getRawRegisters()[64] == 50012);
    // serial number is not polled
    REQUIRE(snapshot->getRawRegisters()[18] == 0);
}

SECTION ("store last snapshot") {
    PollerFixture f;
    f.mSession->connect();
    REQUIRE(f.mPoller->getLastSnapshot() == nullptr);
    DeviceSnapshotPtr snapshot = f.mPoller->pollOnce();
    REQUIRE(f.mPoller->getLastSnapshot() == snapshot);
}

SECTION ("retry soft failures") {
    PollerFixture f;
    f.mSession->connect();
    f.mTransport->failNextRequests(2, MockedTransport::ErrorType::TIMEOUT);
    REQUIRE(f.mPoller->pollOnce() != nullptr);
    // two failed attempts on first span and full successful cycle
    REQUIRE(f.mTransport->getReadCount() == 6);
}

SECTION ("not produce partial snapshot") {
    PollerFixture f;
    f.mSession->connect();
    DeviceSnapshotPtr first = f.mPoller->pollOnce();

    f.mTransport->setRegister(1000, 2000);
    f.mTransport->setError(1070, MockedTransport::ErrorType::PROTOCOL);
    try {
        f.mPoller->pollOnce();
        FAIL("Poll did not fail");
    } catch (const PollError& ex) {
        REQUIRE(ex.getCause() == PollError::Cause::SOFT_FAILURE);
        REQUIRE(!ex.isHard());
        REQUIRE(ex.getAttempts() == 3);
    }
    REQUIRE(f.mPoller->getLastSnapshot() == first);
    REQUIRE(f.mPoller->getLastSnapshot()->get(FieldId::POWER)->mValue.getInt64() == 1500);
}

SECTION ("wait with exponential backoff between retries") {
    PollerConfig config = PollerFixture::testConfig();
    config.mRetryBackoff = std::chrono::milliseconds(50);
    config.mMaxReconnectDelay = std::chrono::seconds(1);
    PollerFixture f(config, 10);
    f.mSession->connect();
    f.mTransport->setError(1000, MockedTransport::ErrorType::TIMEOUT);

    auto start = std::chrono::steady_clock::now();
    REQUIRE(pollErrorCause(*f.mPoller) == PollError::Cause::SOFT_FAILURE);
    // 50ms + 100ms
    REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(150));
    REQUIRE(f.mTransport->getReadCount() == 3);
}

SECTION ("limit retry backoff to max reconnect delay") {
    PollerConfig config = PollerFixture::testConfig();
    config.mRetryBackoff = std::chrono::milliseconds(5);
    config.mMaxReconnectDelay = std::chrono::milliseconds(30);
    PollerFixture f(config);
    REQUIRE(f.mPoller->getRetryBackoff(1) == std::chrono::milliseconds(5));
    REQUIRE(f.mPoller->getRetryBackoff(2) == std::chrono::milliseconds(10));
    REQUIRE(f.mPoller->getRetryBackoff(3) == std::chrono::milliseconds(20));
    REQUIRE(f.mPoller->getRetryBackoff(4) == std::chrono::milliseconds(30));
    REQUIRE(f.mPoller->getRetryBackoff(32) == std::chrono::milliseconds(30));
    REQUIRE(f.mPoller->getRetryBackoff(std::numeric_limits<unsigned int>::max()) == std::chrono::milliseconds(30));
}

SECTION ("retry many times without overflowing backoff") {
    PollerConfig config = PollerFixture::testConfig();
    config.mReadRetries = 40;
    config.mRetryBackoff = std::chrono::milliseconds(1);
    config.mMaxReconnectDelay = std::chrono::milliseconds(4);
    PollerFixture f(config, 100);
    f.mSession->connect();
    f.mTransport->setError(1000, MockedTransport::ErrorType::TIMEOUT);

    auto start = std::chrono::steady_clock::now();
    try {
        f.mPoller->pollOnce();
        FAIL("Poll did not fail");
    } catch (const PollError& ex) {
        REQUIRE(ex.getCause() == PollError::Cause::SOFT_FAILURE);
        REQUIRE(ex.getAttempts() == 41);
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(f.mTransport->getReadCount() == 41);
}

SECTION ("fail immediately on transport error") {
    PollerFixture f;
    f.mSession->connect();
    f.mTransport->setError(1030, MockedTransport::ErrorType::TRANSPORT);
    REQUIRE(pollErrorCause(*f.mPoller) == PollError::Cause::HARD_FAILURE);
    REQUIRE(f.mTransport->getReadCount() == 2);
    REQUIRE(f.mSession->getState() == ConnectionState::DISCONNECTED);
}

SECTION ("fail when session is not connected") {
    PollerFixture f;
    REQUIRE(pollErrorCause(*f.mPoller) == PollError::Cause::HARD_FAILURE);
    REQUIRE(f.mTransport->getReadCount() == 0);
}

}

TEST_CASE ("Continuous polling should") {

SECTION ("deliver snapshots until stopped") {
    PollerFixture f;
    int count = 0;
    f.mPoller->run(
        [&](const DeviceSnapshotPtr& snapshot) {
            if (++count == 3)
                f.mPoller->stop();
        },
        Poller::StateChangeCallback()
    );
    REQUIRE(count == 3);
    REQUIRE(!f.mPoller->isRunning());
}

SECTION ("connect session and report state changes") {
    PollerFixture f;
    Transitions transitions;
    f.mPoller->run(
        [&](const DeviceSnapshotPtr& snapshot) { f.mPoller->stop(); },
        [&](ConnectionState oldState, ConnectionState newState) {
            transitions.push_back(std::make_pair(oldState, newState));
        }
    );
    REQUIRE(transitions == Transitions({
        {ConnectionState::DISCONNECTED, ConnectionState::CONNECTING},
        {ConnectionState::CONNECTING, ConnectionState::CONNECTED}
    }));
}

SECTION ("report degraded connection after soft failures") {
    PollerConfig config = PollerFixture::testConfig();
    config.mReadRetries = 0;
    PollerFixture f(config, 3);
    f.mTransport->setError(1000, MockedTransport::ErrorType::TIMEOUT);

    int snapshots = 0;
    Transitions transitions;
    std::thread poller([&]() {
        f.mPoller->run(
            [&](const DeviceSnapshotPtr& snapshot) {
                snapshots++;
                f.mPoller->stop();
            },
            [&](ConnectionState oldState, ConnectionState newState) {
                transitions.push_back(std::make_pair(oldState, newState));
                if (newState == ConnectionState::DEGRADED)
                    f.mTransport->clearError(1000);
            }
        );
    });
    poller.join();

    REQUIRE(snapshots == 1);
    REQUIRE(transitions == Transitions({
        {ConnectionState::DISCONNECTED, ConnectionState::CONNECTING},
        {ConnectionState::CONNECTING, ConnectionState::CONNECTED},
        {ConnectionState::CONNECTED, ConnectionState::DEGRADED},
        {ConnectionState::DEGRADED, ConnectionState::CONNECTED}
    }));
}

SECTION ("reconnect with growing delay") {
    PollerFixture f;
    f.mTransport->setConnectError();

    std::thread poller([&]() {
        f.mPoller->run(
            [&](const DeviceSnapshotPtr& snapshot) { f.mPoller->stop(); },
            Poller::StateChangeCallback()
        );
    });

    while(f.mTransport->getConnectCount() < 3)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    f.mTransport->setConnectError(false);
    poller.join();

    REQUIRE(f.mPoller->getLastSnapshot() != nullptr);
    REQUIRE(f.mTransport->getConnectCount() >= 4);
}

SECTION ("stop during retry backoff") {
    PollerConfig config = PollerFixture::testConfig();
    config.mRetryBackoff = std::chrono::seconds(10);
    config.mMaxReconnectDelay = std::chrono::minutes(1);
    PollerFixture f(config, 10);
    f.mTransport->setError(1000, MockedTransport::ErrorType::TIMEOUT);

    std::thread poller([&]() {
        f.mPoller->run(Poller::SnapshotCallback(), Poller::StateChangeCallback());
    });
    while(f.mTransport->getReadCount() < 1)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    auto start = std::chrono::steady_clock::now();
    f.mPoller->stop();
    poller.join();
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    REQUIRE(f.mTransport->getReadCount() == 1);
}

SECTION ("execute writes from other threads between cycles") {
    PollerConfig config = PollerFixture::testConfig();
    config.mInterval = std::chrono::seconds(10);
    PollerFixture f(config);

    std::thread poller([&]() {
        f.mPoller->run(Poller::SnapshotCallback(), Poller::StateChangeCallback());
    });
    while(f.mPoller->getLastSnapshot() == nullptr)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    const RegisterField& field(f.mPoller->getRegisterMap()->getField(FieldId::POWER));
    f.mPoller->write(field, {1200});
    REQUIRE(f.mTransport->getRegister(1000) == 1200);

    f.mTransport->setError(1002, MockedTransport::ErrorType::PROTOCOL);
    REQUIRE_THROWS_AS(f.mPoller->write(1002, {600}), ProtocolError);
    // writes are not retried
    REQUIRE(f.mTransport->getWriteCount() == 2);

    f.mPoller->stop();
    poller.join();
}

SECTION ("write directly to session when not running") {
    PollerFixture f;
    f.mPoller->stop();
    REQUIRE(!f.mPoller->isRunning());
    REQUIRE_THROWS_AS(f.mPoller->write(1000, {1}), TransportError);
}

SECTION ("refuse to run twice") {
    PollerConfig config = PollerFixture::testConfig();
    config.mInterval = std::chrono::seconds(10);
    PollerFixture f(config);

    std::thread poller([&]() {
        f.mPoller->run(Poller::SnapshotCallback(), Poller::StateChangeCallback());
    });
    while(!f.mPoller->isRunning())
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    REQUIRE_THROWS_AS(f.mPoller->run(Poller::SnapshotCallback(), Poller::StateChangeCallback()), MyPvProgramException);
    f.mPoller->stop();
    poller.join();
}

}
