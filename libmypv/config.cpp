#include <boost/filesystem.hpp>
#include "config.hpp"
#include "yaml_converters.hpp"

namespace fs = boost::filesystem;

namespace mypv {

boost::log::sources::severity_logger<Log::severity> DeviceConfig::log;

#if __cplusplus < 201703L
constexpr std::chrono::milliseconds ModbusNetworkConfig::MAX_RESPONSE_TIMEOUT;
constexpr unsigned int PollerConfig::MAX_READ_RETRIES;
#endif

ConfigurationException::ConfigurationException(const YAML::Mark& mark, const char* what) {
    mWhat = "config error";
    if (mark.is_null()) {
        mWhat += ": ";
    } else {
        mLineNumber = mark.line+1;
        mWhat += "(line ";
        mWhat += std::to_string(mLineNumber);
        mWhat += "): ";
    }
    mWhat += what;
}

ModbusNetworkConfig::ModbusNetworkConfig(const YAML::Node& source) {
    YAML::Node rtNode(ConfigTools::setOptionalValueFromNode<std::chrono::milliseconds>(mResponseTimeout, source, "response_timeout"));
    if (rtNode.IsDefined()) {
        if ((mResponseTimeout < std::chrono::milliseconds::zero()) || (mResponseTimeout > MAX_RESPONSE_TIMEOUT))
            throw ConfigurationException(rtNode.Mark(), "response_timeout value must be in range 0-999ms");
    }

    YAML::Node rtdNode(ConfigTools::setOptionalValueFromNode<std::chrono::milliseconds>(mResponseDataTimeout, source, "response_data_timeout"));
    if (rtdNode.IsDefined()) {
        if ((mResponseDataTimeout < std::chrono::milliseconds::zero()) || (mResponseDataTimeout > MAX_RESPONSE_TIMEOUT))
            throw ConfigurationException(rtdNode.Mark(), "response_data_timeout value must be in range 0-999ms");
    }

    YAML::Node unitNode(ConfigTools::setOptionalValueFromNode<int>(mUnitId, source, "unit_id"));
    if (unitNode.IsDefined() && (mUnitId < 0 || mUnitId > 247))
        throw ConfigurationException(unitNode.Mark(), "unit_id must be in range 0-247");

    if (source["device"]) {
        mType = Type::RTU;
        mDevice = ConfigTools::readRequiredString(source, "device");
        mBaud = ConfigTools::readRequiredValue<int>(source, "baud");
        mParity = ConfigTools::readRequiredValue<char>(source, "parity");
        mDataBit = ConfigTools::readRequiredValue<int>(source, "data_bit");
        mStopBit = ConfigTools::readRequiredValue<int>(source, "stop_bit");
        ConfigTools::readOptionalValue<RtuSerialMode>(mRtuSerialMode, source, "rtu_serial_mode");
        ConfigTools::readOptionalValue<RtuRtsMode>(mRtsMode, source, "rtu_rts_mode");
        ConfigTools::readOptionalValue<int>(mRtsDelayUs, source, "rtu_rts_delay_us");
    } else if (source["address"]) {
        mType = Type::TCPIP;
        mAddress = ConfigTools::readRequiredString(source, "address");
        ConfigTools::readOptionalValue<int>(mPort, source, "port");
    } else {
        throw ConfigurationException(source.Mark(), "Cannot determine modbus network type: missing 'device' or 'address'");
    }
}

std::string
ModbusNetworkConfig::getDescription() const {
    if (mType == Type::TCPIP)
        return mAddress + ":" + std::to_string(mPort);
    return mDevice;
}

SessionConfig::SessionConfig(const YAML::Node& source) {
    YAML::Node deadlineNode(ConfigTools::setOptionalValueFromNode<std::chrono::milliseconds>(mRequestDeadline, source, "request_deadline"));
    if (deadlineNode.IsDefined() && mRequestDeadline.count() == 0)
        throw ConfigurationException(deadlineNode.Mark(), "request_deadline must be greater than zero");

    YAML::Node degradeNode(ConfigTools::setOptionalValueFromNode<unsigned int>(mDegradeAfter, source, "degrade_after"));
    if (degradeNode.IsDefined() && mDegradeAfter == 0)
        throw ConfigurationException(degradeNode.Mark(), "degrade_after must be at least 1");
}

PollerConfig::PollerConfig(const YAML::Node& source) {
    YAML::Node intervalNode(ConfigTools::setOptionalValueFromNode<std::chrono::milliseconds>(mInterval, source, "interval"));
    if (intervalNode.IsDefined() && mInterval.count() == 0)
        throw ConfigurationException(intervalNode.Mark(), "interval must be greater than zero");

    YAML::Node retriesNode(ConfigTools::setOptionalValueFromNode<unsigned int>(mReadRetries, source, "read_retries"));
    if (retriesNode.IsDefined() && mReadRetries > MAX_READ_RETRIES)
        throw ConfigurationException(retriesNode.Mark(), "read_retries cannot be greater than " + std::to_string(MAX_READ_RETRIES));
    ConfigTools::readOptionalValue<std::chrono::milliseconds>(mRetryBackoff, source, "retry_backoff");

    YAML::Node spanNode(ConfigTools::setOptionalValueFromNode<int>(mMaxReadSpan, source, "max_read_span"));
    if (spanNode.IsDefined() && (mMaxReadSpan < 1 || mMaxReadSpan > 125))
        throw ConfigurationException(spanNode.Mark(), "max_read_span must be in range 1-125");

    ConfigTools::readOptionalValue<std::chrono::milliseconds>(mReconnectDelay, source, "reconnect_delay");
    YAML::Node maxDelayNode(ConfigTools::setOptionalValueFromNode<std::chrono::milliseconds>(mMaxReconnectDelay, source, "max_reconnect_delay"));
    if (mMaxReconnectDelay < mReconnectDelay) {
        throw ConfigurationException(maxDelayNode.IsDefined() ? maxDelayNode.Mark() : source.Mark(),
            "max_reconnect_delay cannot be shorter than reconnect_delay");
    }
}

DeviceConfig::DeviceConfig(const YAML::Node& source) {
    const YAML::Node& modbus = source["modbus"];
    if (!modbus.IsDefined() || !modbus.IsMap())
        throw ConfigurationException(source.Mark(), "Missing 'modbus' section");
    mModbus = ModbusNetworkConfig(modbus);

    const YAML::Node& session = source["session"];
    if (session.IsDefined())
        mSession = SessionConfig(session);

    const YAML::Node& poll = source["poll"];
    if (poll.IsDefined())
        mPoller = PollerConfig(poll);
}

DeviceConfig
DeviceConfig::loadFile(const std::string& path) {
    fs::path filePath(path);
    if (!fs::exists(filePath) || fs::is_directory(filePath))
        throw ConfigurationException(YAML::Mark::null_mark(), "'" + path + "' is not a readable file");

    BOOST_LOG_SEV(log, Log::debug) << "Loading configuration from " << fs::absolute(filePath).native();
    return DeviceConfig(YAML::LoadFile(path));
}

}
