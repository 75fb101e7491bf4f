#include "register_map.hpp"

#include "acthor_types.hpp"

namespace mypv {

namespace {

const Scale UNIT;
const Scale TENTH(1, 10);
const Scale MILLI(1, 1000);

const int64_t U16_MAX = 0xFFFF;
const int64_t I16_MIN = -32768;
const int64_t I16_MAX = 32767;

// 5.0-90.0 °C
const int64_t HOT_WATER_MIN = 50;
const int64_t HOT_WATER_MAX = 900;

RegisterField
u16(FieldId id, const char* name, uint16_t address, const char* unit = "", Scale scale = UNIT,
    int64_t rawMin = 0, int64_t rawMax = U16_MAX)
{
    return RegisterField(id, name, address, RegisterEncoding::U16, scale, unit, rawMin, rawMax);
}

RegisterField
temperature(FieldId id, const char* name, uint16_t address) {
    return RegisterField(id, name, address, RegisterEncoding::I16, TENTH, "°C", I16_MIN, I16_MAX);
}

RegisterField
flag(FieldId id, const char* name, uint16_t address) {
    return RegisterField(id, name, address, RegisterEncoding::BITFIELD, UNIT, "", 0, 1);
}

RegisterField
tagged(FieldId id, const char* name, uint16_t address, const std::vector<EnumTag>& tags) {
    return RegisterField(id, name, address, RegisterEncoding::ENUM, UNIT, "", 0, U16_MAX).withTags(tags);
}

std::vector<EnumTag>
utcCorrectionTags() {
    std::vector<EnumTag> ret;
    const std::vector<UtcCorrection>& zones(UtcCorrection::table());
    for(size_t i = 0; i < zones.size(); i++)
        ret.push_back(EnumTag(i, zones[i].mName));
    return ret;
}

} //namespace

const std::vector<RegisterField>&
RegisterMap::acThorFields() {
    static const std::vector<EnumTag> boostModeTags = {
        EnumTag(0, "OFF"),
        EnumTag(1, "ON"),
        EnumTag(3, "RELAY_BOOST_ON")
    };

    static const std::vector<EnumTag> updateStatusTags = {
        EnumTag(0, "UP_TO_DATE"),
        EnumTag(1, "UPDATE_AVAILABLE"),
        EnumTag(2, "DOWNLOAD_INI"),
        EnumTag(3, "DOWNLOAD_BIN"),
        EnumTag(4, "DOWNLOAD_OTHER_FILES"),
        EnumTag(5, "DOWNLOAD_INTERRUPT"),
        EnumTag(10, "WAITING_FOR_INSTALLATION")
    };

    static const std::vector<EnumTag> operationModeTags = {
        EnumTag(1, "WATER_HEATING_3KW"),
        EnumTag(2, "WATER_HEATING_STRATIFIED"),
        EnumTag(3, "WATER_HEATING_6KW"),
        EnumTag(4, "WATER_HEATING_HEAT_PUMP"),
        EnumTag(5, "WATER_HEATING_ROOM_HEATING"),
        EnumTag(6, "ROOM_HEATING_1_CIRCUIT"),
        EnumTag(7, "WATER_HEATING_PWM"),
        EnumTag(8, "FREQUENCY_MODE")
    };

    static const std::vector<EnumTag> operationStateTags = {
        EnumTag(0, "STANDBY"),
        EnumTag(1, "HEATING_WITH_PV_EXCESS"),
        EnumTag(2, "BOOST_BACKUP_MODE"),
        EnumTag(3, "TEMPERATURE_SETPOINT_REACHED"),
        EnumTag(4, "NO_CONTROL_SIGNAL"),
        EnumTag(5, "RED_CROSS_FLASHES")
    };

    static const std::vector<EnumTag> controlTypeTags = {
        EnumTag(1, "HTTP"),
        EnumTag(2, "MODBUS_TCP"),
        EnumTag(3, "FRONIUS_AUTO"),
        EnumTag(4, "FRONIUS_MANUAL"),
        EnumTag(5, "SMA_HOME_MANAGER"),
        EnumTag(6, "STECA_AUTO"),
        EnumTag(7, "VARTA_AUTO"),
        EnumTag(8, "VARTA_MANUAL"),
        EnumTag(9, "MY_PV_POWER_METER_AUTO"),
        EnumTag(10, "MY_PV_POWER_METER_MANUAL"),
        EnumTag(11, "MY_PV_POWER_METER_DIRECT"),
        EnumTag(12, "MODBUS_RTU"),
        EnumTag(13, "SLAVE"),
        EnumTag(14, "RCT_POWER_MANUAL"),
        EnumTag(15, "ADJUSTABLE_MODBUS_TCP"),
        EnumTag(17, "SMA_DIRECT_METER_COMMUNICATION_AUTO"),
        EnumTag(18, "SMA_DIRECT_METER_COMMUNICATION_MANUAL"),
        EnumTag(19, "DIRECT_METER_P1"),
        EnumTag(20, "FREQUENCY"),
        EnumTag(100, "FRONIUS_SUNSPEC_MANUAL"),
        EnumTag(101, "KACO_TL1_TL3_MANUAL"),
        EnumTag(102, "KOSTAL_PIKO_IQ_PLENTICORE_PLUS_MANUAL"),
        EnumTag(103, "KOSTAL_SMART_ENERGY_METER_MANUAL"),
        EnumTag(104, "MEC_ELECTRONICS_MANUAL"),
        EnumTag(105, "SOLAREDGE_MANUAL"),
        EnumTag(106, "VICTRON_1PH_MANUAL"),
        EnumTag(107, "VICTRON_3PH_MANUAL"),
        EnumTag(108, "HUAWEI_MANUAL"),
        EnumTag(109, "CARLO_GAVAZZI_EM24_MANUAL"),
        EnumTag(111, "SUNGROW_MANUAL"),
        EnumTag(112, "FRONIUS_GEN24_MANUAL"),
        EnumTag(113, "GOOD_WE_MANUAL"),
        EnumTag(200, "HUAWEI_MODBUS_RTU"),
        EnumTag(201, "GROWATT_MODBUS_RTU"),
        EnumTag(202, "SOLAX_MODBUS_RTU"),
        EnumTag(203, "QCELLS_MODBUS_RTU"),
        EnumTag(204, "IME_CONTO_D4_MODBUS_RTU")
    };

    static const std::vector<EnumTag> utcTags = utcCorrectionTags();

    static const std::vector<RegisterField> fields = {
        u16(FieldId::POWER, "power", 1000, "W"),
        temperature(FieldId::TEMPERATURE_1, "temperature_1", 1001),
        u16(FieldId::HOT_WATER_1_MAX, "hot_water_1_max", 1002, "°C", TENTH, HOT_WATER_MIN, HOT_WATER_MAX),
        u16(FieldId::STATUS, "status", 1003),
        u16(FieldId::POWER_TIMEOUT, "power_timeout", 1004, "s"),
        tagged(FieldId::BOOST_MODE, "boost_mode", 1005, boostModeTags),
        u16(FieldId::HOT_WATER_1_MIN, "hot_water_1_min", 1006, "°C", TENTH, HOT_WATER_MIN, HOT_WATER_MAX),
        u16(FieldId::BOOST_TIME_1_START, "boost_time_1_start", 1007, "h", UNIT, 0, 23),
        u16(FieldId::BOOST_TIME_1_STOP, "boost_time_1_stop", 1008, "h", UNIT, 0, 24),
        u16(FieldId::CLOCK_HOUR, "clock_hour", 1009, "h", UNIT, 0, 23),
        u16(FieldId::CLOCK_MINUTE, "clock_minute", 1010, "min", UNIT, 0, 59),
        u16(FieldId::CLOCK_SECOND, "clock_second", 1011, "s", UNIT, 0, 59),
        flag(FieldId::BOOST_ACTIVE, "boost_active", 1012),
        u16(FieldId::DEVICE_NUMBER, "device_number", 1013),
        u16(FieldId::MAX_POWER, "max_power", 1014, "W"),
        temperature(FieldId::TEMPERATURE_CHIP, "temperature_chip", 1015),
        u16(FieldId::CONTROL_FW_VERSION, "control_firmware_version", 1016),
        u16(FieldId::PS_FW_VERSION, "ps_firmware_version", 1017),
        // 1018-1025 serial number, read with device identity
        u16(FieldId::BOOST_TIME_2_START, "boost_time_2_start", 1026, "h", UNIT, 0, 23),
        u16(FieldId::BOOST_TIME_2_STOP, "boost_time_2_stop", 1027, "h", UNIT, 0, 24),
        u16(FieldId::CONTROL_FW_SUB_VERSION, "control_firmware_sub_version", 1028),
        tagged(FieldId::CONTROL_FW_UPDATE_STATUS, "control_firmware_update_status", 1029, updateStatusTags),
        temperature(FieldId::TEMPERATURE_2, "temperature_2", 1030),
        temperature(FieldId::TEMPERATURE_3, "temperature_3", 1031),
        temperature(FieldId::TEMPERATURE_4, "temperature_4", 1032),
        temperature(FieldId::TEMPERATURE_5, "temperature_5", 1033).requiring(FieldRequirement::TEMPERATURE_SENSOR_5),
        temperature(FieldId::TEMPERATURE_6, "temperature_6", 1034).requiring(FieldRequirement::TEMPERATURE_SENSOR_6),
        temperature(FieldId::TEMPERATURE_7, "temperature_7", 1035).requiring(FieldRequirement::TEMPERATURE_SENSOR_7),
        temperature(FieldId::TEMPERATURE_8, "temperature_8", 1036).requiring(FieldRequirement::TEMPERATURE_SENSOR_8),
        u16(FieldId::HOT_WATER_2_MAX, "hot_water_2_max", 1037, "°C", TENTH, HOT_WATER_MIN, HOT_WATER_MAX)
            .requiring(FieldRequirement::WATER_HEATING_UNIT_2),
        u16(FieldId::HOT_WATER_3_MAX, "hot_water_3_max", 1038, "°C", TENTH, HOT_WATER_MIN, HOT_WATER_MAX)
            .requiring(FieldRequirement::WATER_HEATING_UNIT_3),
        u16(FieldId::HOT_WATER_2_MIN, "hot_water_2_min", 1039, "°C", TENTH, HOT_WATER_MIN, HOT_WATER_MAX)
            .requiring(FieldRequirement::WATER_HEATING_UNIT_2),
        u16(FieldId::HOT_WATER_3_MIN, "hot_water_3_min", 1040, "°C", TENTH, HOT_WATER_MIN, HOT_WATER_MAX)
            .requiring(FieldRequirement::WATER_HEATING_UNIT_3),
        u16(FieldId::ROOM_HEATING_1_MAX, "room_heating_1_max", 1041, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_2_MAX, "room_heating_2_max", 1042, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_3_MAX, "room_heating_3_max", 1043, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_1_MIN_DAY, "room_heating_1_min_day", 1044, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_2_MIN_DAY, "room_heating_2_min_day", 1045, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_3_MIN_DAY, "room_heating_3_min_day", 1046, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_1_MIN_NIGHT, "room_heating_1_min_night", 1047, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_2_MIN_NIGHT, "room_heating_2_min_night", 1048, "°C", TENTH),
        u16(FieldId::ROOM_HEATING_3_MIN_NIGHT, "room_heating_3_min_night", 1049, "°C", TENTH),
        flag(FieldId::NIGHT, "night", 1050),
        tagged(FieldId::UTC_CORRECTION, "utc_correction", 1051, utcTags),
        flag(FieldId::DST_CORRECTION, "dst_correction", 1052),
        u16(FieldId::LEGIONELLA_INTERVAL, "legionella_interval", 1053, "d"),
        u16(FieldId::LEGIONELLA_START, "legionella_start", 1054, "h", UNIT, 0, 23),
        u16(FieldId::LEGIONELLA_TEMPERATURE, "legionella_temperature", 1055, "°C"),
        flag(FieldId::LEGIONELLA_MODE, "legionella_mode", 1056),
        flag(FieldId::STRATIFICATION_FLAG, "stratification_flag", 1057),
        flag(FieldId::RELAY_1_STATUS, "relay_1_status", 1058),
        RegisterField(FieldId::LOAD_STATE, "load_state", 1059, RegisterEncoding::BITFIELD, UNIT, "", 0, 7),
        u16(FieldId::LOAD_NOMINAL_POWER, "load_nominal_power", 1060, "W"),
        u16(FieldId::VOLTAGE_L1, "voltage_l1", 1061, "V"),
        u16(FieldId::CURRENT_L1, "current_l1", 1062, "A", TENTH),
        u16(FieldId::VOLTAGE_OUT, "voltage_out", 1063, "V"),
        u16(FieldId::FREQUENCY, "frequency", 1064, "Hz", MILLI),
        tagged(FieldId::OPERATION_MODE, "operation_mode", 1065, operationModeTags),
        u16(FieldId::VOLTAGE_L2, "voltage_l2", 1067, "V").requiring(FieldRequirement::THREE_PHASES),
        u16(FieldId::CURRENT_L2, "current_l2", 1068, "A", TENTH).requiring(FieldRequirement::THREE_PHASES),
        RegisterField(FieldId::METER_POWER, "meter_power", 1069, RegisterEncoding::I16, UNIT, "W", I16_MIN, I16_MAX),
        tagged(FieldId::CONTROL_TYPE, "control_type", 1070, controlTypeTags),
        u16(FieldId::MAX_POWER_ABS, "max_power_abs", 1071, "W").requiring(FieldRequirement::MAX_POWER_ABS_REGISTER),
        u16(FieldId::VOLTAGE_L3, "voltage_l3", 1072, "V").requiring(FieldRequirement::THREE_PHASES),
        u16(FieldId::CURRENT_L3, "current_l3", 1073, "A", TENTH).requiring(FieldRequirement::THREE_PHASES),
        u16(FieldId::POWER_OUT_1, "power_out_1", 1074, "W").requiring(FieldRequirement::POWER_OUTPUTS),
        u16(FieldId::POWER_OUT_2, "power_out_2", 1075, "W").requiring(FieldRequirement::POWER_OUTPUTS),
        u16(FieldId::POWER_OUT_3, "power_out_3", 1076, "W").requiring(FieldRequirement::POWER_OUTPUTS),
        tagged(FieldId::OPERATION_STATE, "operation_state", 1077, operationStateTags),
        RegisterField(FieldId::POWER_32, "power_32", 1078, RegisterEncoding::U32, UNIT, "W", 0, 0xFFFFFFFF),
        RegisterField(FieldId::POWER_WITH_RELAYS, "power_with_relays", 1080, RegisterEncoding::BITFIELD, UNIT, "", 0, U16_MAX)
            .requiring(FieldRequirement::POWER_WITH_RELAYS_REGISTER),
        flag(FieldId::DEVICE_STATE, "device_state", 1081).requiring(FieldRequirement::DEVICE_STATE_REGISTER),
        u16(FieldId::DEVICE_POWER_TOTAL, "device_power_total", 1082, "W").requiring(FieldRequirement::DEVICE_POWERS),
        u16(FieldId::DEVICE_POWER_SOLAR, "device_power_solar", 1083, "W").requiring(FieldRequirement::DEVICE_POWERS),
        u16(FieldId::DEVICE_POWER_GRID, "device_power_grid", 1084, "W").requiring(FieldRequirement::DEVICE_POWERS),
        u16(FieldId::PWM_OUT, "pwm_out", 1085, "%", UNIT, 0, 100).requiring(FieldRequirement::PWM_OUT_REGISTER),
        RegisterField(FieldId::METER_POWER_32, "meter_power_32", 1087, RegisterEncoding::I32, UNIT, "W", INT32_MIN, INT32_MAX)
            .requiring(FieldRequirement::METER_POWER_32_REGISTER)
    };
    return fields;
}

}
