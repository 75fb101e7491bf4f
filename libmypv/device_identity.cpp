#include "device_identity.hpp"

#include <cstdio>

#include "acthor_types.hpp"
#include "exceptions.hpp"

namespace mypv {

boost::log::sources::severity_logger<Log::severity> DeviceIdentity::log;

std::string
FirmwareVersion::toString() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "a%05d%02d", mVersion, mSubVersion);
    return buf;
}

DeviceFeatures
DeviceFeatures::all() {
    DeviceFeatures ret;
    ret.mReadableRegisters = AcThor::REGISTER_COUNT;
    ret.mTemperatureSensors = 8;
    ret.mWaterHeatingUnits = 3;
    ret.mHasLoadStateOutputs = true;
    ret.mHasThreePhases = true;
    ret.mHasMaxPowerAbs = true;
    ret.mHasPowerOutputs = true;
    ret.mHasPowerWithRelays = true;
    ret.mHasDevicePowers = true;
    ret.mHasPwmOut = true;
    ret.mHasMeterPower32 = true;
    return ret;
}

DeviceFeatures
DeviceFeatures::forDevice(DeviceModel model, const FirmwareVersion& fw) {
    bool is9s = model == DeviceModel::AC_THOR_9S;

    DeviceFeatures ret;
    ret.mReadableRegisters = AcThor::REGISTER_COUNT;
    // 101.xx firmware answers only for 1000-1080
    if (fw.mVersion == 101)
        ret.mReadableRegisters = 81;

    // sensors 5-8 and units 2-3 are marked as not available by manufacturer
    ret.mTemperatureSensors = 4;
    ret.mWaterHeatingUnits = 1;
    ret.mHasLoadStateOutputs = fw >= FirmwareVersion(202, 1);
    ret.mHasThreePhases = is9s;
    ret.mHasMaxPowerAbs = fw >= FirmwareVersion(102, 5);
    ret.mHasPowerOutputs = is9s;
    ret.mHasPowerWithRelays = is9s;
    ret.mHasDevicePowers = fw >= FirmwareVersion(203, 3);
    ret.mHasPwmOut = fw >= FirmwareVersion(205, 0);
    ret.mHasMeterPower32 = fw >= FirmwareVersion(210, 2);
    return ret;
}

int
DeviceFeatures::lastReadableRegister() const {
    return AcThor::FIRST_REGISTER + mReadableRegisters - 1;
}

bool
DeviceFeatures::supports(FieldRequirement requirement) const {
    switch(requirement) {
        case FieldRequirement::ALWAYS:
            return true;
        case FieldRequirement::TEMPERATURE_SENSOR_5:
            return mTemperatureSensors >= 5;
        case FieldRequirement::TEMPERATURE_SENSOR_6:
            return mTemperatureSensors >= 6;
        case FieldRequirement::TEMPERATURE_SENSOR_7:
            return mTemperatureSensors >= 7;
        case FieldRequirement::TEMPERATURE_SENSOR_8:
            return mTemperatureSensors >= 8;
        case FieldRequirement::WATER_HEATING_UNIT_2:
            return mWaterHeatingUnits >= 2;
        case FieldRequirement::WATER_HEATING_UNIT_3:
            return mWaterHeatingUnits >= 3;
        case FieldRequirement::THREE_PHASES:
            return mHasThreePhases;
        case FieldRequirement::MAX_POWER_ABS_REGISTER:
            return mHasMaxPowerAbs;
        case FieldRequirement::POWER_OUTPUTS:
            return mHasPowerOutputs;
        case FieldRequirement::POWER_WITH_RELAYS_REGISTER:
            return mHasPowerWithRelays;
        case FieldRequirement::DEVICE_STATE_REGISTER:
            return mReadableRegisters >= 82;
        case FieldRequirement::DEVICE_POWERS:
            return mHasDevicePowers;
        case FieldRequirement::PWM_OUT_REGISTER:
            return mHasPwmOut;
        case FieldRequirement::METER_POWER_32_REGISTER:
            return mHasMeterPower32;
    }
    return false;
}

const char*
DeviceIdentity::modelName(DeviceModel model) {
    switch(model) {
        case DeviceModel::AC_THOR: return "AC-THOR";
        case DeviceModel::AC_THOR_9S: return "AC-THOR 9s";
    }
    return "unknown";
}

std::string
DeviceIdentity::decodeSerialNumber(const std::vector<uint16_t>& words) {
    std::string ret;
    for(uint16_t word: words) {
        char chars[2] = { static_cast<char>(word >> 8), static_cast<char>(word & 0xff) };
        for(char c: chars) {
            if (c == '\0')
                return ret;
            if (c < 0x20 || c > 0x7e)
                throw UnknownDeviceModel("Serial number contains non-ASCII data");
            ret += c;
        }
    }
    return ret;
}

DeviceIdentity
DeviceIdentity::fromRegisters(const std::vector<uint16_t>& words) {
    if (words.size() != AcThor::IDENTITY_REGISTER_COUNT) {
        throw UnknownDeviceModel(std::string("Identity span needs ") + std::to_string(AcThor::IDENTITY_REGISTER_COUNT)
            + " registers, got " + std::to_string(words.size()));
    }

    int snOffset = AcThor::SERIAL_NUMBER_REGISTER - AcThor::IDENTITY_FIRST_REGISTER;
    std::vector<uint16_t> snWords(
        words.begin() + snOffset,
        words.begin() + snOffset + AcThor::SERIAL_NUMBER_REGISTER_COUNT
    );
    std::string serial = decodeSerialNumber(snWords);

    FirmwareVersion fw(
        words[0],
        words[AcThor::FW_SUB_VERSION_REGISTER - AcThor::IDENTITY_FIRST_REGISTER]
    );

    // product code is a prefix of serial number
    DeviceModel model;
    if (serial.compare(0, 4, "2001") == 0) {
        model = DeviceModel::AC_THOR;
    } else if (serial.compare(0, 4, "2002") == 0) {
        model = DeviceModel::AC_THOR_9S;
    } else {
        throw UnknownDeviceModel("Cannot determine device model from serial number '" + serial + "'");
    }

    BOOST_LOG_SEV(log, Log::info) << "Found " << modelName(model) << ", serial number " << serial
        << ", control firmware " << fw.toString();

    return DeviceIdentity(model, serial, fw);
}

}
