#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mypv {

/**
 * Register addresses of AC-THOR holding registers
 * used outside of the register map
 * */
class AcThor {
    public:
        static constexpr uint16_t FIRST_REGISTER = 1000;
        // 1000-1088 as documented by manufacturer
        static constexpr int REGISTER_COUNT = 89;

        static constexpr uint16_t IDENTITY_FIRST_REGISTER = 1016;
        static constexpr int IDENTITY_REGISTER_COUNT = 13;
        static constexpr uint16_t SERIAL_NUMBER_REGISTER = 1018;
        static constexpr int SERIAL_NUMBER_REGISTER_COUNT = 8;
        static constexpr uint16_t FW_SUB_VERSION_REGISTER = 1028;

        static constexpr double HOT_WATER_MIN_TEMP = 5.0;
        static constexpr double HOT_WATER_MAX_TEMP = 90.0;
};

enum class StatusCategory {
    OFF = 0,
    START_UP = 1,
    OPERATION = 9,
    ERROR = 200
};

class StatusCode {
    public:
        StatusCode(int code = 0) : mCode(code) {}

        StatusCategory getCategory() const {
            if (mCode >= static_cast<int>(StatusCategory::ERROR))
                return StatusCategory::ERROR;
            if (mCode >= static_cast<int>(StatusCategory::OPERATION))
                return StatusCategory::OPERATION;
            if (mCode >= static_cast<int>(StatusCategory::START_UP))
                return StatusCategory::START_UP;
            return StatusCategory::OFF;
        }

        // CATEGORY (code)
        std::string toString() const;

        static const char* categoryName(StatusCategory category);

        int mCode;
};

enum class BoostMode : uint16_t {
    OFF = 0,
    ON = 1,
    RELAY_BOOST_ON = 3
};

enum class UpdateStatus : uint16_t {
    UP_TO_DATE = 0,
    UPDATE_AVAILABLE = 1,
    DOWNLOAD_INI = 2,
    DOWNLOAD_BIN = 3,
    DOWNLOAD_OTHER_FILES = 4,
    DOWNLOAD_INTERRUPT = 5,
    WAITING_FOR_INSTALLATION = 10
};

enum class OperationMode : uint16_t {
    WATER_HEATING_3KW = 1,
    WATER_HEATING_STRATIFIED = 2,
    WATER_HEATING_6KW = 3,
    WATER_HEATING_HEAT_PUMP = 4,
    WATER_HEATING_ROOM_HEATING = 5,
    ROOM_HEATING_1_CIRCUIT = 6,
    WATER_HEATING_PWM = 7,
    FREQUENCY_MODE = 8
};

enum class OperationState : uint16_t {
    STANDBY = 0,
    HEATING_WITH_PV_EXCESS = 1,
    BOOST_BACKUP_MODE = 2,
    TEMPERATURE_SETPOINT_REACHED = 3,
    NO_CONTROL_SIGNAL = 4,
    RED_CROSS_FLASHES = 5
};

enum class ControlType : uint16_t {
    HTTP = 1,
    MODBUS_TCP = 2,
    FRONIUS_AUTO = 3,
    FRONIUS_MANUAL = 4,
    SMA_HOME_MANAGER = 5,
    STECA_AUTO = 6,
    VARTA_AUTO = 7,
    VARTA_MANUAL = 8,
    MY_PV_POWER_METER_AUTO = 9,
    MY_PV_POWER_METER_MANUAL = 10,
    MY_PV_POWER_METER_DIRECT = 11,
    MODBUS_RTU = 12,
    SLAVE = 13,
    RCT_POWER_MANUAL = 14,
    ADJUSTABLE_MODBUS_TCP = 15,
    SMA_DIRECT_METER_COMMUNICATION_AUTO = 17,
    SMA_DIRECT_METER_COMMUNICATION_MANUAL = 18,
    DIRECT_METER_P1 = 19,
    FREQUENCY = 20,
    FRONIUS_SUNSPEC_MANUAL = 100,
    KACO_TL1_TL3_MANUAL = 101,
    KOSTAL_PIKO_IQ_PLENTICORE_PLUS_MANUAL = 102,
    KOSTAL_SMART_ENERGY_METER_MANUAL = 103,
    MEC_ELECTRONICS_MANUAL = 104,
    SOLAREDGE_MANUAL = 105,
    VICTRON_1PH_MANUAL = 106,
    VICTRON_3PH_MANUAL = 107,
    HUAWEI_MANUAL = 108,
    CARLO_GAVAZZI_EM24_MANUAL = 109,
    SUNGROW_MANUAL = 111,
    FRONIUS_GEN24_MANUAL = 112,
    GOOD_WE_MANUAL = 113,
    HUAWEI_MODBUS_RTU = 200,
    GROWATT_MODBUS_RTU = 201,
    SOLAX_MODBUS_RTU = 202,
    QCELLS_MODBUS_RTU = 203,
    IME_CONTO_D4_MODBUS_RTU = 204
};

enum class PowerStageOutput : uint16_t {
    OFF = 0,
    OUT_1 = 1,
    OUT_2 = 2,
    OUT_3 = 3
};

/**
 * Contents of power with relays register
 * */
class PowerStage {
    public:
        PowerStage(uint16_t raw = 0) : mRaw(raw) {}

        // bit 14
        bool isRelayOut2Active() const { return (mRaw & (1 << 14)) != 0; }
        // bit 15
        bool isRelayOut3Active() const { return (mRaw & (1 << 15)) != 0; }
        // bits 12-13
        PowerStageOutput getOutput() const {
            return static_cast<PowerStageOutput>((mRaw >> 12) & 0x3);
        }
        // bits 0-11, W
        int getPower() const { return mRaw & 0xfff; }

        uint16_t mRaw;
};

class TemperatureRange {
    public:
        double mMin;
        double mMax;
};

class RoomHeatingSettings {
    public:
        double mMaxTemp;
        double mMinTempDay;
        double mMinTempNight;
};

class LegionellaSettings {
    public:
        int mIntervalDays;
        int mStartHour;
        double mTemperature;
        bool mEnabled;
};

class BoostTime {
    public:
        int mStartHour;
        int mStopHour;
};

class DevicePowers {
    public:
        int mTotal;
        int mSolar;
        int mGrid;
};

/**
 * Time zone selected on device, index into UtcCorrection::table()
 * */
class UtcCorrection {
    public:
        UtcCorrection(int offsetMinutes, const char* name)
            : mOffsetMinutes(offsetMinutes), mName(name) {}

        int mOffsetMinutes;
        const char* mName;

        // +01:00, -09:30
        std::string offsetString() const;

        static const std::vector<UtcCorrection>& table();
};

class DeviceTime {
    public:
        int mHour;
        int mMinute;
        int mSecond;
        UtcCorrection mUtcCorrection;

        // 00:06:22+01:00
        std::string toString() const;
};

}
