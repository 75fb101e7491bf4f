#pragma once
#include <cstdint>
#include <chrono>
#include <string>

#include <yaml-cpp/yaml.h>

#include "exceptions.hpp"
#include "logging.hpp"

namespace mypv {

class ConfigurationException : public MyPvException {
    public:
        ConfigurationException(const YAML::Mark& mark, const char* what);
        ConfigurationException(const YAML::Mark& mark, const std::string& what) : ConfigurationException(mark, what.c_str()) {};

        // 0 if unknown
        int getLineNumber() const { return mLineNumber; }
    private:
        int mLineNumber = 0;
};

class ConfigTools {
    public:
        template <typename T>
        static T readRequiredValue(const YAML::Node& node) {
            if (!node.IsScalar()) {
                std::string err = "string expected, list/null found";
                throw ConfigurationException(node.Mark(), err);
            }
            return convert<T>(node);
        }

        template <typename T>
        static T readRequiredValue(const YAML::Node& parent, const char* nodeName) {

            const YAML::Node& node = parent[nodeName];
            if (!node.IsDefined()) {
                std::string err = std::string("Missing reqired property '") + nodeName + "'";
                throw ConfigurationException(parent.Mark(), err);
            }
            return readRequiredValue<T>(node);
        }

        static std::string readRequiredString(const YAML::Node& parent, const char* nodeName) {
            std::string ret(readRequiredValue<std::string>(parent, nodeName));
            if (ret.empty()) {
                std::string err = std::string(nodeName) + " is an empty string";
                throw ConfigurationException(parent.Mark(), err);
            }
            return ret;
        }

        template <typename T>
        static bool readOptionalValue(T& pDest, const YAML::Node& parent, const char* nodeName) {
            return setOptionalValueFromNode<T>(pDest, parent, nodeName).IsDefined();
        }

        /**
         * Like readOptionalValue, but returns node for
         * reporting range errors with line number.
         * Returned node is undefined if value is not set
         * */
        template <typename T>
        static YAML::Node setOptionalValueFromNode(T& pDest, const YAML::Node& parent, const char* nodeName) {
            const YAML::Node& node = parent[nodeName];
            if (!node.IsDefined())
                return node;

            if (!node.IsScalar()) {
                std::string err = std::string(nodeName) + " must have a single value. List/null found";
                throw ConfigurationException(parent.Mark(), err);
            }

            pDest = convert<T>(node);
            return node;
        }

    private:
        template <typename T>
        static T convert(const YAML::Node& node) {
            try {
                return node.as<T>();
            } catch (const YAML::BadConversion& ex) {
                throw ConfigurationException(node.Mark(), std::string("Invalid value '") + node.Scalar() + "'");
            }
        }
};


class ModbusNetworkConfig {
    public:
        typedef enum {
            RTU,
            TCPIP
        } Type;

        typedef enum {
            NONE,
            UP,
            DOWN
        } RtuRtsMode;

        typedef enum {
            UNSPECIFIED,
            RS232,
            RS485
        } RtuSerialMode;

        static constexpr std::chrono::milliseconds MAX_RESPONSE_TIMEOUT = std::chrono::milliseconds(999);

        ModbusNetworkConfig() {}
        ModbusNetworkConfig(const YAML::Node& source);

        Type mType = Type::TCPIP;
        int mUnitId = 1;
        std::chrono::milliseconds mResponseTimeout = std::chrono::milliseconds(500);
        std::chrono::milliseconds mResponseDataTimeout = std::chrono::seconds(0);

        //RTU only
        std::string mDevice = "";
        int mBaud = 0;
        char mParity = '\0';
        int mDataBit = 0;
        int mStopBit = 0;
        RtuSerialMode mRtuSerialMode = RtuSerialMode::UNSPECIFIED;
        RtuRtsMode mRtsMode = RtuRtsMode::NONE;
        int mRtsDelayUs = 0;

        //TCP only
        std::string mAddress = "";
        int mPort = 502;

        // host:port or device path for log messages
        std::string getDescription() const;
};

class SessionConfig {
    public:
        SessionConfig() {}
        SessionConfig(const YAML::Node& source);

        std::chrono::milliseconds mRequestDeadline = std::chrono::seconds(2);
        // consecutive soft failures before connection is marked as degraded
        unsigned int mDegradeAfter = 3;
};

class PollerConfig {
    public:
        static constexpr unsigned int MAX_READ_RETRIES = 10;

        PollerConfig() {}
        PollerConfig(const YAML::Node& source);

        std::chrono::milliseconds mInterval = std::chrono::seconds(5);
        unsigned int mReadRetries = 2;
        std::chrono::milliseconds mRetryBackoff = std::chrono::milliseconds(100);
        int mMaxReadSpan = 125;
        std::chrono::milliseconds mReconnectDelay = std::chrono::seconds(5);
        std::chrono::milliseconds mMaxReconnectDelay = std::chrono::seconds(60);
};

/**
 * Root of configuration file
 * */
class DeviceConfig {
    public:
        DeviceConfig(const YAML::Node& source);

        static DeviceConfig loadFile(const std::string& path);

        ModbusNetworkConfig mModbus;
        SessionConfig mSession;
        PollerConfig mPoller;
    private:
        static boost::log::sources::severity_logger<Log::severity> log;
};

}
