#include "mockedtransport.hpp"

#include <thread>

#include "libmypv/exceptions.hpp"

const std::chrono::milliseconds MockedTransport::sDefaultReadTime = std::chrono::milliseconds(1);
const std::chrono::milliseconds MockedTransport::sDefaultWriteTime = std::chrono::milliseconds(1);

void
MockedTransport::connect() {
    std::unique_lock<std::mutex> lck(mMutex);
    mConnectCount++;
    if (mBroken)
        throw mypv::MyPvProgramException("TEST: transport not initialized");
    if (mConnectError || mDisconnected)
        throw mypv::ConnectError("TEST: connection refused");
    mIsConnected = true;
}

bool
MockedTransport::isConnected() const {
    std::unique_lock<std::mutex> lck(mMutex);
    return mIsConnected;
}

void
MockedTransport::close() {
    std::unique_lock<std::mutex> lck(mMutex);
    mIsConnected = false;
}

MockedTransport::ErrorType
MockedTransport::findError(int address, int count) {
    if (mFailNextCount > 0) {
        mFailNextCount--;
        return mFailNextError;
    }
    for(int i = address; i < address + count; i++) {
        auto it = mRegisters.find(i);
        if (it != mRegisters.end() && it->second.mError != ErrorType::NONE)
            return it->second.mError;
    }
    return ErrorType::NONE;
}

void
MockedTransport::throwError(ErrorType error, int address) {
    switch(error) {
        case ErrorType::TIMEOUT:
            throw mypv::TimeoutError(std::string("TEST: no answer for register ") + std::to_string(address));
        case ErrorType::PROTOCOL:
            // illegal data address
            throw mypv::ProtocolError(2, std::string("TEST: exception response for register ") + std::to_string(address));
        case ErrorType::TRANSPORT:
            mIsConnected = false;
            throw mypv::TransportError(std::string("TEST: connection lost at register ") + std::to_string(address));
        default:
            break;
    }
}

std::vector<uint16_t>
MockedTransport::readRegisters(uint16_t address, int count) {
    std::chrono::milliseconds readTime;
    {
        std::unique_lock<std::mutex> lck(mMutex);
        readTime = mReadTime;
    }
    std::this_thread::sleep_for(readTime);

    std::unique_lock<std::mutex> lck(mMutex);
    mReadCount++;
    if (!mIsConnected || mDisconnected) {
        mIsConnected = false;
        throw mypv::TransportError(std::string("TEST: read ") + std::to_string(address) + " failed, not connected");
    }

    ErrorType error = findError(address, count);
    throwError(error, address);

    std::vector<uint16_t> ret;
    for(int i = address; i < address + count; i++) {
        auto it = mRegisters.find(i);
        ret.push_back(it == mRegisters.end() ? 0 : it->second.mValue);
    }
    if (error == ErrorType::WRONG_COUNT)
        ret.pop_back();

    BOOST_LOG_SEV(log, mypv::Log::trace) << "TEST: read " << address << " count " << count;
    return ret;
}

void
MockedTransport::writeRegisters(uint16_t address, const std::vector<uint16_t>& values) {
    std::chrono::milliseconds writeTime;
    {
        std::unique_lock<std::mutex> lck(mMutex);
        writeTime = mWriteTime;
    }
    std::this_thread::sleep_for(writeTime);

    std::unique_lock<std::mutex> lck(mMutex);
    mWriteCount++;
    if (!mIsConnected || mDisconnected) {
        mIsConnected = false;
        throw mypv::TransportError(std::string("TEST: write ") + std::to_string(address) + " failed, not connected");
    }
    throwError(findError(address, values.size()), address);

    for(size_t i = 0; i < values.size(); i++)
        mRegisters[address + i].mValue = values[i];
    mWrites.push_back(std::make_pair(address, values));
    BOOST_LOG_SEV(log, mypv::Log::trace) << "TEST: write " << address << " count " << values.size();
}

void
MockedTransport::setRegister(int address, uint16_t value) {
    std::unique_lock<std::mutex> lck(mMutex);
    mRegisters[address].mValue = value;
}

void
MockedTransport::setRegisters(int address, const std::vector<uint16_t>& values) {
    std::unique_lock<std::mutex> lck(mMutex);
    for(size_t i = 0; i < values.size(); i++)
        mRegisters[address + i].mValue = values[i];
}

uint16_t
MockedTransport::getRegister(int address) const {
    std::unique_lock<std::mutex> lck(mMutex);
    auto it = mRegisters.find(address);
    return it == mRegisters.end() ? 0 : it->second.mValue;
}

void
MockedTransport::setError(int address, ErrorType error) {
    std::unique_lock<std::mutex> lck(mMutex);
    mRegisters[address].mError = error;
}

void
MockedTransport::failNextRequests(int count, ErrorType error) {
    std::unique_lock<std::mutex> lck(mMutex);
    mFailNextCount = count;
    mFailNextError = error;
}

void
MockedTransport::setDisconnected(bool flag) {
    std::unique_lock<std::mutex> lck(mMutex);
    mDisconnected = flag;
}

void
MockedTransport::setConnectError(bool flag) {
    std::unique_lock<std::mutex> lck(mMutex);
    mConnectError = flag;
}

void
MockedTransport::setBroken(bool flag) {
    std::unique_lock<std::mutex> lck(mMutex);
    mBroken = flag;
}

void
MockedTransport::setReadTime(std::chrono::milliseconds time) {
    std::unique_lock<std::mutex> lck(mMutex);
    mReadTime = time;
}

void
MockedTransport::setWriteTime(std::chrono::milliseconds time) {
    std::unique_lock<std::mutex> lck(mMutex);
    mWriteTime = time;
}

int
MockedTransport::getReadCount() const {
    std::unique_lock<std::mutex> lck(mMutex);
    return mReadCount;
}

int
MockedTransport::getWriteCount() const {
    std::unique_lock<std::mutex> lck(mMutex);
    return mWriteCount;
}

int
MockedTransport::getConnectCount() const {
    std::unique_lock<std::mutex> lck(mMutex);
    return mConnectCount;
}

std::vector<std::pair<int, std::vector<uint16_t>>>
MockedTransport::getWrites() const {
    std::unique_lock<std::mutex> lck(mMutex);
    return mWrites;
}

void
MockedTransport::setupDevice(const std::string& serialNumber, int fwVersion, int fwSubVersion) {
    std::vector<uint16_t> serial(8, 0);
    for(size_t i = 0; i < serialNumber.size() && i < 16; i++) {
        uint16_t c = static_cast<uint8_t>(serialNumber[i]);
        serial[i / 2] |= (i % 2 == 0) ? (c << 8) : c;
    }

    setRegister(1000, 1500);    // power
    setRegister(1001, 452);     // temperature 1, 45.2 °C
    setRegister(1002, 600);     // hot water max 60.0 °C
    setRegister(1003, 9);       // status
    setRegister(1004, 60);      // power timeout
    setRegister(1005, 1);       // boost mode
    setRegister(1006, 500);     // hot water min 50.0 °C
    setRegister(1007, 5);
    setRegister(1008, 6);
    setRegister(1009, 0);       // 00:06:22
    setRegister(1010, 6);
    setRegister(1011, 22);
    setRegister(1014, 3000);    // max power
    setRegister(1015, 381);     // chip temperature
    setRegister(1016, fwVersion);
    setRegister(1017, 104);
    setRegisters(1018, serial);
    setRegister(1028, fwSubVersion);
    setRegister(1030, 0xFFEC);  // temperature 2, -2.0 °C
    setRegister(1051, 15);      // CET
    setRegister(1059, 0x5);
    setRegister(1061, 230);
    setRegister(1062, 65);
    setRegister(1063, 229);
    setRegister(1064, 50012);   // 50.012 Hz
    setRegister(1065, 1);
    setRegister(1067, 231);
    setRegister(1068, 43);
    setRegister(1069, 0xFF38);  // meter power -200 W
    setRegister(1070, 2);
    setRegister(1072, 232);
    setRegister(1073, 12);
    setRegister(1078, 0x0001);  // power 32, 70000 W
    setRegister(1079, 0x1170);
    setRegister(1080, 0x6123);  // relay 2 on, output 2, 291 W
    setRegister(1087, 0xFFFF);  // meter power 32, -300 W
    setRegister(1088, 0xFED4);
}
