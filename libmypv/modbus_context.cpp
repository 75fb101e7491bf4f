#include "modbus_context.hpp"

#include <cerrno>

namespace mypv {

void
ModbusContext::init(const ModbusNetworkConfig& config)
{
    mDescription = config.getDescription();
    if (config.mType == ModbusNetworkConfig::TCPIP) {
        BOOST_LOG_SEV(log, Log::info) << "Creating TCP context for " << mDescription;
        mCtx = modbus_new_tcp(config.mAddress.c_str(), config.mPort);
        if (mCtx == nullptr)
            throw ModbusContextException("Unable to create context");
        modbus_set_error_recovery(mCtx,
            (modbus_error_recovery_mode)
                (MODBUS_ERROR_RECOVERY_PROTOCOL|MODBUS_ERROR_RECOVERY_LINK)
        );
    } else {
        initRtu(config);
    }

    int unitId = config.mUnitId;
    if (unitId == 0 && config.mType == ModbusNetworkConfig::TCPIP)
        unitId = MODBUS_TCP_SLAVE;
    if (modbus_set_slave(mCtx, unitId))
        throw ModbusContextException("Unable to set unit id " + std::to_string(unitId));

    setTimeouts(config);
}

void
ModbusContext::initRtu(const ModbusNetworkConfig& config) {
    BOOST_LOG_SEV(log, Log::info) << "Creating RTU context: " << config.mDevice << ", " << config.mBaud << "-" << config.mDataBit << config.mParity << config.mStopBit;
    mCtx = modbus_new_rtu(
        config.mDevice.c_str(),
        config.mBaud,
        config.mParity,
        config.mDataBit,
        config.mStopBit
    );
    if (mCtx == nullptr)
        throw ModbusContextException("Unable to create context");

    modbus_set_error_recovery(mCtx, MODBUS_ERROR_RECOVERY_PROTOCOL);

    int serialMode;
    std::string serialModeStr;
    switch (config.mRtuSerialMode) {
        case ModbusNetworkConfig::RtuSerialMode::RS232:
            serialMode = MODBUS_RTU_RS232;
            serialModeStr = "RS232";
            break;
        case ModbusNetworkConfig::RtuSerialMode::RS485:
            serialMode = MODBUS_RTU_RS485;
            serialModeStr = "RS485";
            break;
        case ModbusNetworkConfig::RtuSerialMode::UNSPECIFIED:
        default:
            serialMode = -1;
            break;
    }
    if (serialMode >= 0) {
        if (modbus_rtu_set_serial_mode(mCtx, serialMode)) {
            throw ModbusContextException("Unable to set RTU serial mode");
        }
        BOOST_LOG_SEV(log, Log::info) << "RTU serial mode set to " << serialModeStr;
    }

    int rtsMode;
    std::string rtsModeStr;
    switch (config.mRtsMode) {
        case ModbusNetworkConfig::RtuRtsMode::UP:
            rtsMode = MODBUS_RTU_RTS_UP;
            rtsModeStr = "UP";
            break;
        case ModbusNetworkConfig::RtuRtsMode::DOWN:
            rtsMode = MODBUS_RTU_RTS_DOWN;
            rtsModeStr = "DOWN";
            break;
        case ModbusNetworkConfig::RtuRtsMode::NONE:
        default:
            rtsMode = -1;
            break;
    }
    if (rtsMode >= 0) {
        if (modbus_rtu_set_rts(mCtx, rtsMode)) {
            throw ModbusContextException("Unable to set RTS mode");
        }
        BOOST_LOG_SEV(log, Log::info) << "RTU RTS mode set to " << rtsModeStr;
    }

    if (config.mRtsDelayUs > 0) {
        if (modbus_rtu_set_rts_delay(mCtx, config.mRtsDelayUs)) {
            throw ModbusContextException("Unable to set RTS delay");
        }
        BOOST_LOG_SEV(log, Log::info) << "RTU delay set to " << config.mRtsDelayUs << "us";
    }
}

void
ModbusContext::setTimeouts(const ModbusNetworkConfig& config) {
    uint32_t us = std::chrono::duration_cast<std::chrono::microseconds>(config.mResponseTimeout).count();
    if (modbus_set_response_timeout(mCtx, 0, us)) {
        throw ModbusContextException("Unable to set response timeout");
    }
    BOOST_LOG_SEV(log, Log::info) << "Response timeout set to " << config.mResponseTimeout.count() << "ms";

    if (config.mResponseDataTimeout.count() > 0) {
        us = std::chrono::duration_cast<std::chrono::microseconds>(config.mResponseDataTimeout).count();
        if (modbus_set_byte_timeout(mCtx, 0, us)) {
            throw ModbusContextException("Unable to set response data timeout");
        }
        BOOST_LOG_SEV(log, Log::info) << "Data response timeout set to " << config.mResponseDataTimeout.count() << "ms";
    }
}

void
ModbusContext::connect() {
    if (mCtx == nullptr)
        throw MyPvProgramException("Modbus context is not initialized");

    modbus_close(mCtx);

    if (modbus_connect(mCtx) == -1) {
        mIsConnected = false;
        throw ConnectError(std::string("Connection to ") + mDescription + " failed: " + modbus_strerror(errno));
    }
    mIsConnected = true;
}

void
ModbusContext::close() {
    if (mCtx != nullptr)
        modbus_close(mCtx);
    mIsConnected = false;
}

void
ModbusContext::handleError(const std::string& desc) {
    int err = errno;
    std::string msg = desc + ": " + modbus_strerror(err);

    if (err == ETIMEDOUT)
        throw TimeoutError(msg);

    if (err >= EMBXILFUN && err <= EMBXGTAR)
        throw ProtocolError(err - MODBUS_ENOBASE, msg);

    switch(err) {
        case EMBBADCRC:
        case EMBBADDATA:
        case EMBBADEXC:
        case EMBUNKEXC:
        case EMBMDATA:
        case EMBBADSLAVE:
            throw ProtocolError(ProtocolError::MALFORMED_RESPONSE, msg);
    }

    // connection is unusable, caller needs to reconnect
    close();
    throw TransportError(msg);
}

std::vector<uint16_t>
ModbusContext::readRegisters(uint16_t address, int count) {
    if (!mIsConnected)
        throw TransportError("Not connected to " + mDescription);

    std::vector<uint16_t> ret(count, 0);
    int retCode = modbus_read_registers(mCtx, address, count, ret.data());
    if (retCode == -1)
        handleError(std::string("read of ") + std::to_string(count) + " registers at " + std::to_string(address) + " failed");

    if (retCode != count) {
        throw ProtocolError(ProtocolError::MALFORMED_RESPONSE,
            std::string("read at ") + std::to_string(address) + " returned " + std::to_string(retCode)
            + " registers, requested " + std::to_string(count));
    }
    return ret;
}

void
ModbusContext::writeRegisters(uint16_t address, const std::vector<uint16_t>& values) {
    if (!mIsConnected)
        throw TransportError("Not connected to " + mDescription);

    int retCode;
    if (values.size() == 1) {
        retCode = modbus_write_register(mCtx, address, values[0]);
    } else {
        retCode = modbus_write_registers(mCtx, address, values.size(), values.data());
    }
    if (retCode == -1)
        handleError(std::string("write of ") + std::to_string(values.size()) + " registers at " + std::to_string(address) + " failed");
}

} //namespace
