#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "logging.hpp"
#include "register_field.hpp"

namespace mypv {

typedef enum {
    AC_THOR,
    AC_THOR_9S
} DeviceModel;

class FirmwareVersion {
    public:
        FirmwareVersion(int version = 0, int subVersion = 0)
            : mVersion(version), mSubVersion(subVersion) {}

        int mVersion;
        int mSubVersion;

        bool operator==(const FirmwareVersion& other) const {
            return mVersion == other.mVersion && mSubVersion == other.mSubVersion;
        }
        bool operator<(const FirmwareVersion& other) const {
            if (mVersion != other.mVersion)
                return mVersion < other.mVersion;
            return mSubVersion < other.mSubVersion;
        }
        bool operator>=(const FirmwareVersion& other) const { return !(*this < other); }

        // a0010103 for 101.3
        std::string toString() const;
};

/**
 * Capabilities of a device variant. Registers exist in the map for
 * all variants, but some of them have no meaning for a particular
 * model or firmware
 * */
class DeviceFeatures {
    public:
        // everything enabled, used for maps not bound to any device
        static DeviceFeatures all();
        static DeviceFeatures forDevice(DeviceModel model, const FirmwareVersion& fw);

        bool supports(FieldRequirement requirement) const;

        // last register that the device answers for
        int lastReadableRegister() const;

        int mReadableRegisters;
        int mTemperatureSensors;
        int mWaterHeatingUnits;
        bool mHasLoadStateOutputs;
        bool mHasThreePhases;
        bool mHasMaxPowerAbs;
        bool mHasPowerOutputs;
        bool mHasPowerWithRelays;
        bool mHasDevicePowers;
        bool mHasPwmOut;
        bool mHasMeterPower32;
};

class DeviceIdentity {
    public:
        /**
         * Builds identity from contents of identity span
         * (AcThor::IDENTITY_FIRST_REGISTER, AcThor::IDENTITY_REGISTER_COUNT words).
         * Throws UnknownDeviceModel if device cannot be recognized.
         * */
        static DeviceIdentity fromRegisters(const std::vector<uint16_t>& words);

        DeviceIdentity(DeviceModel model, const std::string& serialNumber, const FirmwareVersion& fw)
            : mModel(model), mSerialNumber(serialNumber), mFirmwareVersion(fw) {}

        DeviceFeatures getFeatures() const { return DeviceFeatures::forDevice(mModel, mFirmwareVersion); }

        static const char* modelName(DeviceModel model);
        static std::string decodeSerialNumber(const std::vector<uint16_t>& words);

        DeviceModel mModel;
        std::string mSerialNumber;
        FirmwareVersion mFirmwareVersion;
    private:
        static boost::log::sources::severity_logger<Log::severity> log;
};

}
