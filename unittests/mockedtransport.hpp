#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "libmypv/imodbustransport.hpp"
#include "libmypv/logging.hpp"

/**
 * In-memory AC-THOR holding registers with error injection
 * */
class MockedTransport : public mypv::IModbusTransport {
    public:
        typedef enum {
            NONE,
            TIMEOUT,
            PROTOCOL,
            TRANSPORT,
            // answer with one register less than requested
            WRONG_COUNT
        } ErrorType;

        static const std::chrono::milliseconds sDefaultReadTime;
        static const std::chrono::milliseconds sDefaultWriteTime;

        virtual void init(const mypv::ModbusNetworkConfig& config) {}
        virtual void connect();
        virtual bool isConnected() const;
        virtual void close();
        virtual std::vector<uint16_t> readRegisters(uint16_t address, int count);
        virtual void writeRegisters(uint16_t address, const std::vector<uint16_t>& values);

        void setRegister(int address, uint16_t value);
        void setRegisters(int address, const std::vector<uint16_t>& values);
        uint16_t getRegister(int address) const;

        // error returned for every request containing address
        void setError(int address, ErrorType error);
        void clearError(int address) { setError(address, ErrorType::NONE); }
        // next count requests fail regardless of address
        void failNextRequests(int count, ErrorType error);
        void setDisconnected(bool flag = true);
        void setConnectError(bool flag = true);
        // connect() throws program error instead of ConnectError
        void setBroken(bool flag = true);
        void setReadTime(std::chrono::milliseconds time);
        void setWriteTime(std::chrono::milliseconds time);

        int getReadCount() const;
        int getWriteCount() const;
        int getConnectCount() const;
        std::vector<std::pair<int, std::vector<uint16_t>>> getWrites() const;

        /**
         * Identity span and a realistic set of values
         * for AC-THOR with given serial and firmware
         * */
        void setupDevice(const std::string& serialNumber, int fwVersion, int fwSubVersion);

    private:
        struct RegData {
            uint16_t mValue = 0;
            ErrorType mError = ErrorType::NONE;
        };

        ErrorType findError(int address, int count);
        void throwError(ErrorType error, int address);

        boost::log::sources::severity_logger<mypv::Log::severity> log;
        mutable std::mutex mMutex;
        std::map<int, RegData> mRegisters;
        std::chrono::milliseconds mReadTime = sDefaultReadTime;
        std::chrono::milliseconds mWriteTime = sDefaultWriteTime;
        bool mIsConnected = false;
        bool mDisconnected = false;
        bool mConnectError = false;
        bool mBroken = false;
        int mFailNextCount = 0;
        ErrorType mFailNextError = ErrorType::NONE;
        int mReadCount = 0;
        int mWriteCount = 0;
        int mConnectCount = 0;
        std::vector<std::pair<int, std::vector<uint16_t>>> mWrites;
};
