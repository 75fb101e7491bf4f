#pragma once

#include <chrono>
#include <regex>

#include <yaml-cpp/yaml.h>
#include "config.hpp"

template<>
struct YAML::convert<mypv::ModbusNetworkConfig::RtuSerialMode> {
    static bool decode(const YAML::Node& node, mypv::ModbusNetworkConfig::RtuSerialMode& rhs) {
        auto str = node.as<std::string>();
        if (str == "rs232") {
            rhs = mypv::ModbusNetworkConfig::RtuSerialMode::RS232;
        } else if (str == "rs485") {
            rhs = mypv::ModbusNetworkConfig::RtuSerialMode::RS485;
        } else {
            return false;
        }
        return true;
    }
};

template<>
struct YAML::convert<mypv::ModbusNetworkConfig::RtuRtsMode> {
    static bool decode(const YAML::Node& node, mypv::ModbusNetworkConfig::RtuRtsMode& rhs) {
        auto str = node.as<std::string>();
        if (str == "down") {
            rhs = mypv::ModbusNetworkConfig::RtuRtsMode::DOWN;
        } else if (str == "up") {
            rhs = mypv::ModbusNetworkConfig::RtuRtsMode::UP;
        } else {
            return false;
        }
        return true;
    }
};

template<>
struct YAML::convert<std::chrono::milliseconds> {
    static bool decode(const YAML::Node& node, std::chrono::milliseconds& value) {
        const std::regex re("\\s*([0-9]+)\\s*(ms|s|min|h)\\s*");
        std::cmatch matches;
        std::string strval = node.as<std::string>();

        if (!std::regex_match(strval.c_str(), matches, re))
            throw mypv::ConfigurationException(node.Mark(), "Invalid time specification");

        long long mval = std::stoll(matches[1]);
        std::string unit = matches[2];
        if (unit == "s")
            value = std::chrono::seconds(mval);
        else if (unit == "min")
            value = std::chrono::minutes(mval);
        else if (unit == "h")
            value = std::chrono::hours(mval);
        else
            value = std::chrono::milliseconds(mval);
        return true;
    }
};
