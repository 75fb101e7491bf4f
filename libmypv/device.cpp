#include "device.hpp"

#include "exceptions.hpp"
#include "register_codec.hpp"

namespace mypv {

boost::log::sources::severity_logger<Log::severity> Device::log;

namespace {

const FieldId TEMPERATURES[] = {
    FieldId::TEMPERATURE_1, FieldId::TEMPERATURE_2, FieldId::TEMPERATURE_3, FieldId::TEMPERATURE_4,
    FieldId::TEMPERATURE_5, FieldId::TEMPERATURE_6, FieldId::TEMPERATURE_7, FieldId::TEMPERATURE_8
};

const FieldId HOT_WATER_MIN[] = { FieldId::HOT_WATER_1_MIN, FieldId::HOT_WATER_2_MIN, FieldId::HOT_WATER_3_MIN };
const FieldId HOT_WATER_MAX[] = { FieldId::HOT_WATER_1_MAX, FieldId::HOT_WATER_2_MAX, FieldId::HOT_WATER_3_MAX };

const FieldId ROOM_HEATING_MAX[] = { FieldId::ROOM_HEATING_1_MAX, FieldId::ROOM_HEATING_2_MAX, FieldId::ROOM_HEATING_3_MAX };
const FieldId ROOM_HEATING_MIN_DAY[] = { FieldId::ROOM_HEATING_1_MIN_DAY, FieldId::ROOM_HEATING_2_MIN_DAY, FieldId::ROOM_HEATING_3_MIN_DAY };
const FieldId ROOM_HEATING_MIN_NIGHT[] = { FieldId::ROOM_HEATING_1_MIN_NIGHT, FieldId::ROOM_HEATING_2_MIN_NIGHT, FieldId::ROOM_HEATING_3_MIN_NIGHT };

const FieldId VOLTAGES[] = { FieldId::VOLTAGE_L1, FieldId::VOLTAGE_L2, FieldId::VOLTAGE_L3 };
const FieldId CURRENTS[] = { FieldId::CURRENT_L1, FieldId::CURRENT_L2, FieldId::CURRENT_L3 };
const FieldId POWER_OUTPUTS[] = { FieldId::POWER_OUT_1, FieldId::POWER_OUT_2, FieldId::POWER_OUT_3 };

const int HOT_WATER_UNITS = 3;
const int ROOM_HEATING_CIRCUITS = 3;
const int MAX_TEMPERATURE_SENSORS = 8;

// 0.1 °C
const int64_t TEMPERATURE_RESOLUTION = 10;

}

std::unique_ptr<Device>
Device::connect(
    const std::shared_ptr<IModbusTransport>& transport,
    const SessionConfig& sessionConfig,
    const PollerConfig& pollerConfig
) {
    std::shared_ptr<Session> session(new Session(transport, sessionConfig));
    session->connect();

    std::vector<uint16_t> identityWords(session->read(AcThor::IDENTITY_FIRST_REGISTER, AcThor::IDENTITY_REGISTER_COUNT));
    DeviceIdentity identity(DeviceIdentity::fromRegisters(identityWords));
    std::shared_ptr<const RegisterMap> registerMap(RegisterMap::forDevice(identity));

    return std::unique_ptr<Device>(new Device(identity, session, registerMap, pollerConfig));
}

Device::Device(
    const DeviceIdentity& identity,
    const std::shared_ptr<Session>& session,
    const std::shared_ptr<const RegisterMap>& registerMap,
    const PollerConfig& pollerConfig
) : mIdentity(identity),
    mSession(session),
    mRegisterMap(registerMap),
    mPoller(session, registerMap, pollerConfig)
{
    BOOST_LOG_SEV(log, Log::info) << "Using register map " << mRegisterMap->getName()
        << " for device " << mIdentity.mSerialNumber;
}

DeviceSnapshotPtr
Device::getSnapshot() const {
    DeviceSnapshotPtr snapshot(mPoller.getLastSnapshot());
    if (snapshot == nullptr)
        throw FacadeError(FacadeError::Reason::NO_SNAPSHOT, "No data was read from device yet");
    return snapshot;
}

const SnapshotValue&
Device::getValid(const DeviceSnapshot& snapshot, FieldId id) const {
    const SnapshotValue* val = snapshot.get(id);
    if (val == nullptr || !val->mValid) {
        const RegisterField* field = mRegisterMap->field(id);
        throw FacadeError(FacadeError::Reason::FIELD_NOT_AVAILABLE,
            std::string(field == nullptr ? "Field" : field->mName) + " is not available for "
            + mRegisterMap->getName());
    }
    return *val;
}

DomainValue
Device::getValue(FieldId id) const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    return getValid(*snapshot, id).mValue;
}

double
Device::getDouble(FieldId id) const {
    return getValue(id).getDouble();
}

int64_t
Device::getInt(FieldId id) const {
    return getValue(id).getInt64();
}

bool
Device::getFlag(FieldId id) const {
    return getValue(id).getBool();
}

uint32_t
Device::getRaw(FieldId id) const {
    return getValue(id).getRaw();
}

void
Device::checkIndex(const char* what, int index, int count) {
    if (index < 1 || index > count) {
        throw FacadeError(FacadeError::Reason::FIELD_NOT_AVAILABLE,
            std::string(what) + " " + std::to_string(index) + " does not exist, expected 1.." + std::to_string(count));
    }
}

int
Device::getPower() const {
    return getInt(FieldId::POWER);
}

uint32_t
Device::getPower32() const {
    return static_cast<uint32_t>(getInt(FieldId::POWER_32));
}

PowerStage
Device::getPowerStage() const {
    return PowerStage(getRaw(FieldId::POWER_WITH_RELAYS));
}

DevicePowers
Device::getDevicePowers() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    DevicePowers ret;
    ret.mTotal = getValid(*snapshot, FieldId::DEVICE_POWER_TOTAL).mValue.getInt64();
    ret.mSolar = getValid(*snapshot, FieldId::DEVICE_POWER_SOLAR).mValue.getInt64();
    ret.mGrid = getValid(*snapshot, FieldId::DEVICE_POWER_GRID).mValue.getInt64();
    return ret;
}

int
Device::getMaxPower() const {
    return getInt(FieldId::MAX_POWER);
}

int
Device::getMaxPowerAbs() const {
    return getInt(FieldId::MAX_POWER_ABS);
}

int
Device::getPowerTimeout() const {
    return getInt(FieldId::POWER_TIMEOUT);
}

int
Device::getLoadNominalPower() const {
    return getInt(FieldId::LOAD_NOMINAL_POWER);
}

std::vector<int>
Device::getPowerOutputs() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    std::vector<int> ret;
    for(FieldId id: POWER_OUTPUTS)
        ret.push_back(getValid(*snapshot, id).mValue.getInt64());
    return ret;
}

int32_t
Device::getMeterPower() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    if (snapshot->isValid(FieldId::METER_POWER_32))
        return snapshot->get(FieldId::METER_POWER_32)->mValue.getInt64();
    return getValid(*snapshot, FieldId::METER_POWER).mValue.getInt64();
}

int
Device::getPwmOut() const {
    return getInt(FieldId::PWM_OUT);
}

double
Device::getTemperature(int sensor) const {
    checkIndex("Temperature sensor", sensor, MAX_TEMPERATURE_SENSORS);
    return getDouble(TEMPERATURES[sensor - 1]);
}

std::vector<double>
Device::getTemperatures() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    std::vector<double> ret;
    for(FieldId id: TEMPERATURES) {
        const SnapshotValue* val = snapshot->get(id);
        if (val == nullptr || !val->mValid)
            break;
        ret.push_back(val->mValue.getDouble());
    }
    return ret;
}

double
Device::getChipTemperature() const {
    return getDouble(FieldId::TEMPERATURE_CHIP);
}

TemperatureRange
Device::getHotWaterRange(int unit) const {
    checkIndex("Water heating unit", unit, HOT_WATER_UNITS);
    DeviceSnapshotPtr snapshot(getSnapshot());
    TemperatureRange ret;
    ret.mMin = getValid(*snapshot, HOT_WATER_MIN[unit - 1]).mValue.getDouble();
    ret.mMax = getValid(*snapshot, HOT_WATER_MAX[unit - 1]).mValue.getDouble();
    return ret;
}

RoomHeatingSettings
Device::getRoomHeating(int circuit) const {
    checkIndex("Room heating circuit", circuit, ROOM_HEATING_CIRCUITS);
    DeviceSnapshotPtr snapshot(getSnapshot());
    RoomHeatingSettings ret;
    ret.mMaxTemp = getValid(*snapshot, ROOM_HEATING_MAX[circuit - 1]).mValue.getDouble();
    ret.mMinTempDay = getValid(*snapshot, ROOM_HEATING_MIN_DAY[circuit - 1]).mValue.getDouble();
    ret.mMinTempNight = getValid(*snapshot, ROOM_HEATING_MIN_NIGHT[circuit - 1]).mValue.getDouble();
    return ret;
}

LegionellaSettings
Device::getLegionellaSettings() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    LegionellaSettings ret;
    ret.mIntervalDays = getValid(*snapshot, FieldId::LEGIONELLA_INTERVAL).mValue.getInt64();
    ret.mStartHour = getValid(*snapshot, FieldId::LEGIONELLA_START).mValue.getInt64();
    ret.mTemperature = getValid(*snapshot, FieldId::LEGIONELLA_TEMPERATURE).mValue.getDouble();
    ret.mEnabled = getValid(*snapshot, FieldId::LEGIONELLA_MODE).mValue.getBool();
    return ret;
}

StatusCode
Device::getStatus() const {
    return StatusCode(getInt(FieldId::STATUS));
}

BoostMode
Device::getBoostMode() const {
    return static_cast<BoostMode>(getRaw(FieldId::BOOST_MODE));
}

BoostTime
Device::getBoostTime(int index) const {
    checkIndex("Boost time", index, 2);
    DeviceSnapshotPtr snapshot(getSnapshot());
    BoostTime ret;
    if (index == 1) {
        ret.mStartHour = getValid(*snapshot, FieldId::BOOST_TIME_1_START).mValue.getInt64();
        ret.mStopHour = getValid(*snapshot, FieldId::BOOST_TIME_1_STOP).mValue.getInt64();
    } else {
        ret.mStartHour = getValid(*snapshot, FieldId::BOOST_TIME_2_START).mValue.getInt64();
        ret.mStopHour = getValid(*snapshot, FieldId::BOOST_TIME_2_STOP).mValue.getInt64();
    }
    return ret;
}

bool
Device::isBoostActive() const {
    return getFlag(FieldId::BOOST_ACTIVE);
}

bool
Device::isNight() const {
    return getFlag(FieldId::NIGHT);
}

bool
Device::isStratificationEnabled() const {
    return getFlag(FieldId::STRATIFICATION_FLAG);
}

bool
Device::isRelay1Active() const {
    return getFlag(FieldId::RELAY_1_STATUS);
}

uint32_t
Device::getLoadState() const {
    uint32_t bits = getRaw(FieldId::LOAD_STATE);
    // older firmware reports only a single output
    if (!mRegisterMap->getFeatures().mHasLoadStateOutputs)
        return bits & 0x1;
    return bits & 0x7;
}

OperationMode
Device::getOperationMode() const {
    return static_cast<OperationMode>(getRaw(FieldId::OPERATION_MODE));
}

OperationState
Device::getOperationState() const {
    return static_cast<OperationState>(getRaw(FieldId::OPERATION_STATE));
}

ControlType
Device::getControlType() const {
    return static_cast<ControlType>(getRaw(FieldId::CONTROL_TYPE));
}

bool
Device::getDeviceState() const {
    return getFlag(FieldId::DEVICE_STATE);
}

UtcCorrection
Device::getUtcCorrection() const {
    uint32_t idx = getRaw(FieldId::UTC_CORRECTION);
    const std::vector<UtcCorrection>& zones(UtcCorrection::table());
    if (idx >= zones.size()) {
        throw FacadeError(FacadeError::Reason::FIELD_NOT_AVAILABLE,
            std::string("Unknown UTC correction index ") + std::to_string(idx));
    }
    return zones[idx];
}

DeviceTime
Device::getTime() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    return DeviceTime {
        static_cast<int>(getValid(*snapshot, FieldId::CLOCK_HOUR).mValue.getInt64()),
        static_cast<int>(getValid(*snapshot, FieldId::CLOCK_MINUTE).mValue.getInt64()),
        static_cast<int>(getValid(*snapshot, FieldId::CLOCK_SECOND).mValue.getInt64()),
        getUtcCorrection()
    };
}

bool
Device::isDstCorrectionEnabled() const {
    return getFlag(FieldId::DST_CORRECTION);
}

std::vector<int>
Device::getPhaseVoltages() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    std::vector<int> ret;
    ret.push_back(getValid(*snapshot, VOLTAGES[0]).mValue.getInt64());
    // other phases only on three phase devices
    for(int i = 1; i < 3 && snapshot->isValid(VOLTAGES[i]); i++)
        ret.push_back(snapshot->get(VOLTAGES[i])->mValue.getInt64());
    return ret;
}

std::vector<double>
Device::getPhaseCurrents() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    std::vector<double> ret;
    ret.push_back(getValid(*snapshot, CURRENTS[0]).mValue.getDouble());
    // other phases only on three phase devices
    for(int i = 1; i < 3 && snapshot->isValid(CURRENTS[i]); i++)
        ret.push_back(snapshot->get(CURRENTS[i])->mValue.getDouble());
    return ret;
}

int
Device::getOutputVoltage() const {
    return getInt(FieldId::VOLTAGE_OUT);
}

double
Device::getFrequency() const {
    return getDouble(FieldId::FREQUENCY);
}

int
Device::getDeviceNumber() const {
    return getInt(FieldId::DEVICE_NUMBER);
}

FirmwareVersion
Device::getControlFirmwareVersion() const {
    DeviceSnapshotPtr snapshot(getSnapshot());
    return FirmwareVersion(
        getValid(*snapshot, FieldId::CONTROL_FW_VERSION).mValue.getInt64(),
        getValid(*snapshot, FieldId::CONTROL_FW_SUB_VERSION).mValue.getInt64()
    );
}

int
Device::getPowerStageFirmwareVersion() const {
    return getInt(FieldId::PS_FW_VERSION);
}

UpdateStatus
Device::getUpdateStatus() const {
    return static_cast<UpdateStatus>(getRaw(FieldId::CONTROL_FW_UPDATE_STATUS));
}

void
Device::writeValue(FieldId id, const DomainValue& value) {
    const RegisterField& field(mRegisterMap->getField(id));
    std::vector<uint16_t> words(RegisterCodec::encode(field, value, mRegisterMap->getWordOrder()));
    BOOST_LOG_SEV(log, Log::debug) << "Writing " << value << " to " << field.mName;
    mPoller.write(field, words);
}

void
Device::setPower(int64_t watts) {
    if (watts < 0 || watts > 0xFFFFFFFFLL) {
        throw EncodeError(EncodeError::Reason::OUT_OF_RANGE,
            std::string("Power ") + std::to_string(watts) + "W is out of range 0..4294967295");
    }
    if (watts <= 0xFFFF)
        writeValue(FieldId::POWER, DomainValue::fromInt(watts));
    else
        writeValue(FieldId::POWER_32, DomainValue::fromInt(watts));
}

void
Device::checkTemperature(double temp) {
    if (temp < AcThor::HOT_WATER_MIN_TEMP || temp > AcThor::HOT_WATER_MAX_TEMP) {
        throw EncodeError(EncodeError::Reason::OUT_OF_RANGE,
            std::string("Temperature ") + std::to_string(temp) + " is out of range 5.0..90.0");
    }
}

void
Device::writeTemperature(FieldId id, double temp) {
    checkTemperature(temp);
    writeValue(id, DomainValue::fromDouble(temp, TEMPERATURE_RESOLUTION));
}

void
Device::setHotWaterRange(int unit, double minTemp, double maxTemp) {
    checkIndex("Water heating unit", unit, HOT_WATER_UNITS);
    checkTemperature(minTemp);
    checkTemperature(maxTemp);
    if (minTemp > maxTemp) {
        throw EncodeError(EncodeError::Reason::OUT_OF_RANGE,
            std::string("Minimum temperature ") + std::to_string(minTemp)
            + " is above maximum " + std::to_string(maxTemp));
    }
    // maximum first, device does not accept minimum above current maximum
    writeTemperature(HOT_WATER_MAX[unit - 1], maxTemp);
    writeTemperature(HOT_WATER_MIN[unit - 1], minTemp);
}

void
Device::setHotWaterMin(int unit, double minTemp) {
    checkIndex("Water heating unit", unit, HOT_WATER_UNITS);
    writeTemperature(HOT_WATER_MIN[unit - 1], minTemp);
}

void
Device::setHotWaterMax(int unit, double maxTemp) {
    checkIndex("Water heating unit", unit, HOT_WATER_UNITS);
    writeTemperature(HOT_WATER_MAX[unit - 1], maxTemp);
}

}
