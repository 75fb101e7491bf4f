#pragma once

#include <inttypes.h>
#include <memory>
#include <vector>

#include "config.hpp"

namespace mypv {

/**
    Abstract base class for modbus communication library implementation

    Request methods throw RequestError subclasses: TimeoutError
    when device does not answer, ProtocolError for exception responses
    and malformed frames, TransportError when connection is lost.
*/
class IModbusTransport {
    public:
        virtual void init(const ModbusNetworkConfig& config) = 0;
        // throws ConnectError
        virtual void connect() = 0;
        virtual bool isConnected() const = 0;
        virtual void close() = 0;
        virtual std::vector<uint16_t> readRegisters(uint16_t address, int count) = 0;
        virtual void writeRegisters(uint16_t address, const std::vector<uint16_t>& values) = 0;
        virtual ~IModbusTransport() {};
};

class IModbusFactory {
    public:
        virtual std::shared_ptr<IModbusTransport> getTransport(const ModbusNetworkConfig& config) = 0;
        virtual ~IModbusFactory() {};
};

}
