#pragma once

#include <modbus/modbus.h>

#include "config.hpp"
#include "logging.hpp"
#include "imodbustransport.hpp"

namespace mypv {

/**
 * Wrapper for libmodbus
 * */
class ModbusContext : public IModbusTransport {
    public:
        virtual void init(const ModbusNetworkConfig& config);
        virtual void connect();
        virtual bool isConnected() const { return mIsConnected; }
        virtual void close();
        virtual std::vector<uint16_t> readRegisters(uint16_t address, int count);
        virtual void writeRegisters(uint16_t address, const std::vector<uint16_t>& values);
        virtual ~ModbusContext() {
            if (mCtx != nullptr) {
                modbus_close(mCtx);
                modbus_free(mCtx);
            }
        };
    private:
        boost::log::sources::severity_logger<Log::severity> log;

        void initRtu(const ModbusNetworkConfig& config);
        void setTimeouts(const ModbusNetworkConfig& config);

        /**
         * Throws RequestError subclass matching current errno
         * */
        void handleError(const std::string& desc);

        bool mIsConnected = false;
        modbus_t* mCtx = nullptr;
        std::string mDescription;
};

class ModbusFactory : public IModbusFactory {
    public:
        virtual std::shared_ptr<IModbusTransport> getTransport(const ModbusNetworkConfig& config) {
            std::shared_ptr<IModbusTransport> ret(new ModbusContext());
            ret->init(config);
            return ret;
        }
};

class ModbusContextException : public MyPvException {
    public:
        ModbusContextException(const std::string& what) {
            mWhat = std::string("libmodbus: ") + what + ": " + modbus_strerror(errno);
        }
};

} //namespace
