#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mypv {

typedef enum {
    U16,
    I16,
    U32,
    I32,
    ENUM,
    BITFIELD
} RegisterEncoding;

typedef enum {
    // high word at the lower address
    HIGH_FIRST,
    LOW_FIRST
} WordOrder;

/**
 * Every value exposed by the library. The snake_case name
 * of each field is declared with its RegisterField
 * */
enum class FieldId {
    POWER,
    TEMPERATURE_1,
    HOT_WATER_1_MAX,
    STATUS,
    POWER_TIMEOUT,
    BOOST_MODE,
    HOT_WATER_1_MIN,
    BOOST_TIME_1_START,
    BOOST_TIME_1_STOP,
    CLOCK_HOUR,
    CLOCK_MINUTE,
    CLOCK_SECOND,
    BOOST_ACTIVE,
    DEVICE_NUMBER,
    MAX_POWER,
    TEMPERATURE_CHIP,
    CONTROL_FW_VERSION,
    PS_FW_VERSION,
    BOOST_TIME_2_START,
    BOOST_TIME_2_STOP,
    CONTROL_FW_SUB_VERSION,
    CONTROL_FW_UPDATE_STATUS,
    TEMPERATURE_2,
    TEMPERATURE_3,
    TEMPERATURE_4,
    TEMPERATURE_5,
    TEMPERATURE_6,
    TEMPERATURE_7,
    TEMPERATURE_8,
    HOT_WATER_2_MAX,
    HOT_WATER_3_MAX,
    HOT_WATER_2_MIN,
    HOT_WATER_3_MIN,
    ROOM_HEATING_1_MAX,
    ROOM_HEATING_2_MAX,
    ROOM_HEATING_3_MAX,
    ROOM_HEATING_1_MIN_DAY,
    ROOM_HEATING_2_MIN_DAY,
    ROOM_HEATING_3_MIN_DAY,
    ROOM_HEATING_1_MIN_NIGHT,
    ROOM_HEATING_2_MIN_NIGHT,
    ROOM_HEATING_3_MIN_NIGHT,
    NIGHT,
    UTC_CORRECTION,
    DST_CORRECTION,
    LEGIONELLA_INTERVAL,
    LEGIONELLA_START,
    LEGIONELLA_TEMPERATURE,
    LEGIONELLA_MODE,
    STRATIFICATION_FLAG,
    RELAY_1_STATUS,
    LOAD_STATE,
    LOAD_NOMINAL_POWER,
    VOLTAGE_L1,
    CURRENT_L1,
    VOLTAGE_OUT,
    FREQUENCY,
    OPERATION_MODE,
    VOLTAGE_L2,
    CURRENT_L2,
    METER_POWER,
    CONTROL_TYPE,
    MAX_POWER_ABS,
    VOLTAGE_L3,
    CURRENT_L3,
    POWER_OUT_1,
    POWER_OUT_2,
    POWER_OUT_3,
    OPERATION_STATE,
    POWER_32,
    POWER_WITH_RELAYS,
    DEVICE_STATE,
    DEVICE_POWER_TOTAL,
    DEVICE_POWER_SOLAR,
    DEVICE_POWER_GRID,
    PWM_OUT,
    METER_POWER_32
};

/**
 * Device capability required for field value to have a meaning.
 * Fields that are not supported are still decoded, but marked
 * as invalid in DeviceSnapshot
 * */
typedef enum {
    ALWAYS,
    TEMPERATURE_SENSOR_5,
    TEMPERATURE_SENSOR_6,
    TEMPERATURE_SENSOR_7,
    TEMPERATURE_SENSOR_8,
    WATER_HEATING_UNIT_2,
    WATER_HEATING_UNIT_3,
    THREE_PHASES,
    MAX_POWER_ABS_REGISTER,
    POWER_OUTPUTS,
    POWER_WITH_RELAYS_REGISTER,
    DEVICE_STATE_REGISTER,
    DEVICE_POWERS,
    PWM_OUT_REGISTER,
    METER_POWER_32_REGISTER
} FieldRequirement;

/**
 * Exact rational scale applied to raw register value
 * */
class Scale {
    public:
        Scale() : mNumerator(1), mDenominator(1) {}
        Scale(int64_t numerator, int64_t denominator)
            : mNumerator(numerator), mDenominator(denominator) {}

        int64_t mNumerator;
        int64_t mDenominator;

};

class EnumTag {
    public:
        EnumTag(uint32_t raw, const char* name) : mRaw(raw), mName(name) {}
        uint32_t mRaw;
        const char* mName;
};

class RegisterField {
    public:
        RegisterField(FieldId id, const char* name, uint16_t address, uint8_t wordCount,
            RegisterEncoding encoding, Scale scale, const char* unit, int64_t rawMin, int64_t rawMax)
            : mId(id), mName(name), mAddress(address), mWordCount(wordCount),
              mEncoding(encoding), mScale(scale), mUnit(unit), mRawMin(rawMin), mRawMax(rawMax)
        {}

        RegisterField(FieldId id, const char* name, uint16_t address,
            RegisterEncoding encoding, Scale scale, const char* unit, int64_t rawMin, int64_t rawMax)
            : RegisterField(id, name, address, wordCountFor(encoding), encoding, scale, unit, rawMin, rawMax)
        {}

        RegisterField& requiring(FieldRequirement req) { mRequirement = req; return *this; }
        RegisterField& aliased() { mAliased = true; return *this; }
        RegisterField& withTags(const std::vector<EnumTag>& tags) { mTags = &tags; return *this; }

        FieldId mId;
        const char* mName;
        uint16_t mAddress;
        uint8_t mWordCount;
        RegisterEncoding mEncoding;
        Scale mScale;
        const char* mUnit;
        // valid raw range, checked on encode
        int64_t mRawMin;
        int64_t mRawMax;
        FieldRequirement mRequirement = FieldRequirement::ALWAYS;
        // may overlap other fields in the same map
        bool mAliased = false;
        // for ENUM encoding
        const std::vector<EnumTag>* mTags = nullptr;

        int firstRegister() const { return mAddress; }
        int lastRegister() const { return mAddress + mWordCount - 1; }
        bool overlaps(const RegisterField& other) const {
            return firstRegister() <= other.lastRegister() && other.firstRegister() <= lastRegister();
        }

        const EnumTag* findTag(uint32_t raw) const;
        const EnumTag* findTag(const std::string& name) const;

        static uint8_t wordCountFor(RegisterEncoding encoding);
        static const char* encodingName(RegisterEncoding encoding);
};

}
